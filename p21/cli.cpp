#include "cli.hpp"
#include "p21.h"
#include "p21_error.h"
#include "step_writer.hpp"
#include "format/step_encoder.hpp"
#include "../lib/log.h"
#include <string.h>
#include <string>

namespace p21 {

void print_help(StrBuf* out) {
    strbuf_append_format(out, "p21 - ISO 10303-21 (STEP) writer v%s\n\n", P21_VERSION_STRING);
    strbuf_append_str(out, "Usage:\n");
    strbuf_append_str(out, "  p21 encode [--lenient] <text>     Escape text as a STEP string literal\n");
    strbuf_append_str(out, "  p21 decode <text>                 Decode a STEP string literal\n");
    strbuf_append_str(out, "  p21 sample [--lenient] [-o <file>] Write a small sample STEP file\n");
    strbuf_append_str(out, "  p21 --help                        Show this help\n\n");
    strbuf_append_str(out, "Logging is configured from ./log.conf when present.\n");
}

static int report_error(StrBuf* err, P21Error* error) {
    if (!error) {
        strbuf_append_str(err, "error: out of memory\n");
        return 1;
    }
    err_format(err, error);
    strbuf_append_char(err, '\n');
    err_log(error);
    err_free(error);
    return 1;
}

int exec_encode(int argc, char* argv[], StrBuf* out, StrBuf* err) {
    EncodeMode mode = ENCODE_STRICT;
    const char* text = NULL;
    for (int i = 2; i < argc; i++) {
        if (strcmp(argv[i], "--lenient") == 0) {
            mode = ENCODE_LENIENT;
        } else if (!text) {
            text = argv[i];
        } else {
            return report_error(err, err_createf(ERR_INVALID_ARGUMENT, "unexpected argument '%s'", argv[i]));
        }
    }
    if (!text) {
        return report_error(err, err_create(ERR_INVALID_ARGUMENT, "encode needs a text argument"));
    }

    StrBuf* sb = strbuf_new();
    if (!sb) return report_error(err, err_create(ERR_OUT_OF_MEMORY, NULL));
    strbuf_append_char(sb, '\'');
    size_t offset = 0;
    P21ErrorCode code = StepEncoder::encode(sb, text, mode, &offset);
    if (code != ERR_OK) {
        strbuf_free(sb);
        P21Error* error = err_createf(code, "cannot encode byte at offset %zu", offset);
        err_add_help(error, "use --lenient to drop characters without an encoding");
        return report_error(err, error);
    }
    strbuf_append_str(sb, "'\n");
    strbuf_append_str_n(out, sb->str, sb->length);
    strbuf_free(sb);
    return 0;
}

int exec_decode(int argc, char* argv[], StrBuf* out, StrBuf* err) {
    if (argc != 3) {
        return report_error(err, err_create(ERR_INVALID_ARGUMENT, "decode needs exactly one text argument"));
    }
    std::string text = argv[2];
    // accept a complete literal including its quotes
    if (text.length() >= 2 && text.front() == '\'' && text.back() == '\'') {
        text = text.substr(1, text.length() - 2);
    }

    StrBuf* sb = strbuf_new();
    if (!sb) return report_error(err, err_create(ERR_OUT_OF_MEMORY, NULL));
    size_t offset = 0;
    P21ErrorCode code = StepEncoder::decode(sb, text, &offset);
    if (code != ERR_OK) {
        strbuf_free(sb);
        return report_error(err, err_createf(code, "malformed escape at offset %zu", offset));
    }
    strbuf_append_char(sb, '\n');
    strbuf_append_str_n(out, sb->str, sb->length);
    strbuf_free(sb);
    return 0;
}

int exec_sample(int argc, char* argv[], StrBuf* out, StrBuf* err) {
    WriterOptions options;
    const char* output_file = NULL;
    for (int i = 2; i < argc; i++) {
        if (strcmp(argv[i], "--lenient") == 0) {
            options.encode_mode = ENCODE_LENIENT;
        } else if (strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) {
            if (i + 1 >= argc) {
                return report_error(err, err_createf(ERR_INVALID_ARGUMENT, "%s needs a file name", argv[i]));
            }
            output_file = argv[++i];
        } else {
            return report_error(err, err_createf(ERR_INVALID_ARGUMENT, "unknown option '%s'", argv[i]));
        }
    }

    StepModel model;
    Entity* origin = model.entity("cartesian_point", {attr_string("origin"),
        attr_list({attr_real(0.0), attr_real(0.0), attr_real(0.0)})});
    Entity* z_axis = model.entity("direction", {attr_string("z"),
        attr_list({attr_real(0.0), attr_real(0.0), attr_real(1.0)})});
    Entity* x_axis = model.entity("direction", {attr_string("x"),
        attr_list({attr_real(1.0), attr_real(0.0), attr_real(0.0)})});
    model.root("axis2_placement_3d", {attr_string("world"), attr_ref(origin), attr_ref(z_axis), attr_ref(x_axis)});
    model.root("vertex_point", {attr_string(""), attr_ref(origin)});

    FileHeader header;
    header.description.push_back("p21 sample");
    header.name = output_file ? output_file : "sample.stp";
    header.preprocessor_version = "p21 " P21_VERSION_STRING;
    header.schema_identifiers.push_back("AUTOMOTIVE_DESIGN");

    P21Error* error = nullptr;
    if (output_file) {
        if (write_step_file(output_file, header, model.roots(), options, &error) != ERR_OK) {
            return report_error(err, error);
        }
        log_info("sample written to %s", output_file);
        return 0;
    }

    std::string text;
    if (write_step(header, model.roots(), options, &text, &error) != ERR_OK) {
        return report_error(err, error);
    }
    strbuf_append_str_n(out, text.data(), text.length());
    return 0;
}

int exec_command(int argc, char* argv[], StrBuf* out, StrBuf* err) {
    log_debug("exec_command: %d arguments", argc);
    if (argc < 2 || strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0) {
        print_help(out);
        return 0;
    }
    if (strcmp(argv[1], "encode") == 0) return exec_encode(argc, argv, out, err);
    if (strcmp(argv[1], "decode") == 0) return exec_decode(argc, argv, out, err);
    if (strcmp(argv[1], "sample") == 0) return exec_sample(argc, argv, out, err);

    print_help(err);
    return report_error(err, err_createf(ERR_INVALID_ARGUMENT, "unknown command '%s'", argv[1]));
}

} // namespace p21
