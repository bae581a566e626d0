#include "step_writer.hpp"
#include "../lib/log.h"
#include <stdio.h>
#include <time.h>

namespace p21 {

void format_header_section(StrBuf* sb, const EntityTable& table) {
    for (const CompiledEntity& record : table.records()) {
        strbuf_append_str_n(sb, record.type_name.data(), record.type_name.length());
        strbuf_append_char(sb, '(');
        strbuf_append_str_n(sb, record.attrs.data(), record.attrs.length());
        strbuf_append_str(sb, ");\n");
    }
}

void format_data_section(StrBuf* sb, const EntityTable& table) {
    for (const CompiledEntity& record : table.records()) {
        strbuf_append_format(sb, "#%d=", record.id);
        strbuf_append_str_n(sb, record.type_name.data(), record.type_name.length());
        strbuf_append_char(sb, '(');
        strbuf_append_str_n(sb, record.attrs.data(), record.attrs.length());
        strbuf_append_str(sb, ");\n");
    }
}

static log_category_t* writer_log() {
    return log_get_category("writer");
}

static P21ErrorCode report(P21ErrorCode code, P21Error* failure, P21Error** error) {
    if (error) *error = failure;
    else err_free(failure);
    return code;
}

P21ErrorCode write_step(const FileHeader& header, const std::vector<Entity*>& roots,
                        const WriterOptions& options, std::string* out, P21Error** error) {
    if (error) *error = nullptr;
    clog_debug(writer_log(), "write_step: entry, %zu roots", roots.size());

    FileHeader filled = header;
    if (filled.time_stamp.empty() && options.fill_time_stamp) {
        filled.time_stamp = format_time_stamp(time(NULL));
    }

    StepModel header_model;
    std::vector<Entity*> header_entities = build_header_entities(header_model, filled);

    EntityCompiler header_compiler(options.encode_mode);
    if (header_compiler.compile(header_entities) != ERR_OK) {
        P21ErrorCode code = header_compiler.error_code();
        P21Error* failure = err_create(code, "cannot write HEADER section");
        err_set_cause(failure, header_compiler.take_error());
        return report(code, failure, error);
    }

    EntityCompiler data_compiler(options.encode_mode);
    if (data_compiler.compile(roots) != ERR_OK) {
        P21ErrorCode code = data_compiler.error_code();
        return report(code, data_compiler.take_error(), error);
    }

    StrBuf* sb = strbuf_new_cap(256 + data_compiler.table().size() * 64);
    if (!sb) {
        return report(ERR_OUT_OF_MEMORY, err_create(ERR_OUT_OF_MEMORY, NULL), error);
    }

    strbuf_append_str(sb, P21_FILE_BEGIN "\n" P21_HEADER_BEGIN "\n");
    format_header_section(sb, header_compiler.table());
    strbuf_append_str(sb, P21_SECTION_END "\n" P21_DATA_BEGIN "\n");
    format_data_section(sb, data_compiler.table());
    strbuf_append_str(sb, P21_SECTION_END "\n" P21_FILE_END "\n");

    if (out) out->assign(sb->str, sb->length);
    clog_debug(writer_log(), "write_step: completed, %zu data entities, %zu bytes", data_compiler.table().size(), sb->length);
    strbuf_free(sb);
    return ERR_OK;
}

P21ErrorCode write_step_file(const char* path, const FileHeader& header, const std::vector<Entity*>& roots,
                             const WriterOptions& options, P21Error** error) {
    if (error) *error = nullptr;
    if (!path) {
        return report(ERR_INVALID_ARGUMENT, err_create(ERR_INVALID_ARGUMENT, "output path is null"), error);
    }

    std::string text;
    P21ErrorCode code = write_step(header, roots, options, &text, error);
    if (code != ERR_OK) return code;

    FILE* file = fopen(path, "wb");
    if (!file) {
        clog_error(writer_log(), "write_step_file: cannot open %s", path);
        return report(ERR_FILE_WRITE_ERROR, err_createf(ERR_FILE_WRITE_ERROR, "cannot open %s for writing", path), error);
    }
    size_t written = fwrite(text.data(), 1, text.length(), file);
    int closed = fclose(file);
    if (written != text.length() || closed != 0) {
        clog_error(writer_log(), "write_step_file: short write to %s", path);
        return report(ERR_FILE_WRITE_ERROR, err_createf(ERR_FILE_WRITE_ERROR, "failed writing %s", path), error);
    }
    clog_info(writer_log(), "write_step_file: wrote %zu bytes to %s", text.length(), path);
    return ERR_OK;
}

} // namespace p21
