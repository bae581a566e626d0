// STEP attribute formatter (ISO 10303-21 exchange structure values)
#include "format.h"
#include "../../lib/log.h"
#include <inttypes.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>

namespace p21 {

static void format_attr(StepContext& ctx, const Attribute& attr);

bool format_step_real(StrBuf* sb, double value) {
    if (isnan(value) || isinf(value)) {
        return false;
    }

    // fewest significant digits that read back to the same double
    char num_buf[48];
    int digits = 17;
    for (int precision = 1; precision <= 17; precision++) {
        snprintf(num_buf, sizeof(num_buf), "%.*e", precision - 1, value);
        if (strtod(num_buf, NULL) == value) {
            digits = precision;
            break;
        }
    }
    snprintf(num_buf, sizeof(num_buf), "%.*e", digits - 1, value);

    // positional notation for decimal exponents -4..14, as %.15g would choose
    const char* exp_mark = strchr(num_buf, 'e');
    int decimal_exponent = exp_mark ? atoi(exp_mark + 1) : 0;
    if (decimal_exponent >= -4 && decimal_exponent < 15) {
        int decimals = digits - 1 - decimal_exponent;
        snprintf(num_buf, sizeof(num_buf), "%.*f", decimals > 0 ? decimals : 0, value);
    }

    // exchange structure reals: "." always present, exponent marker 'E'
    char* exp_pos = NULL;
    bool has_point = false;
    for (char* p = num_buf; *p; p++) {
        if (*p == ',') *p = '.';  // locale decimal separator
        if (*p == '.') has_point = true;
        if (*p == 'e' || *p == 'E') {
            *p = 'E';
            exp_pos = p;
        }
    }

    if (has_point) {
        strbuf_append_str(sb, num_buf);
    } else if (exp_pos) {
        strbuf_append_str_n(sb, num_buf, (size_t)(exp_pos - num_buf));
        strbuf_append_char(sb, '.');
        strbuf_append_str(sb, exp_pos);
    } else {
        strbuf_append_str(sb, num_buf);
        strbuf_append_char(sb, '.');
    }
    return true;
}

static void format_string(StepContext& ctx, const std::string& text) {
    ctx.write_char('\'');
    size_t offset = 0;
    P21ErrorCode code = StepEncoder::encode(ctx.output(), text, ctx.encode_mode(), &offset);
    if (code != ERR_OK) {
        ctx.fail(err_createf(code, "string value has no STEP encoding at byte %zu", offset));
        return;
    }
    ctx.write_char('\'');
}

static void format_reference(StepContext& ctx, const Entity* entity) {
    if (!entity) {
        ctx.fail(err_create(ERR_NULL_REFERENCE, NULL));
        return;
    }
    int id = ctx.resolver() ? ctx.resolver()->resolve_reference(entity) : 0;
    if (id <= 0) {
        ctx.fail(err_createf(ERR_INTERNAL_ERROR, "reference to %s has no entity id",
            entity->type_name.c_str()));
        return;
    }
    strbuf_append_format(ctx.output(), "#%d", id);
}

static void format_list(StepContext& ctx, const std::vector<Attribute>& items) {
    ctx.write_char('(');
    for (size_t i = 0; i < items.size() && !ctx.failed(); i++) {
        if (i > 0) ctx.write_char(',');
        format_attr(ctx, items[i]);
    }
    ctx.write_char(')');
}

static void format_attr(StepContext& ctx, const Attribute& attr) {
    switch (attr.type) {
    case P21_TYPE_NULL:
        ctx.write_char('$');
        break;
    case P21_TYPE_DERIVED:
        ctx.write_char('*');
        break;
    case P21_TYPE_INTEGER:
        strbuf_append_int64(ctx.output(), attr.int_val);
        break;
    case P21_TYPE_REAL:
        if (!format_step_real(ctx.output(), attr.real_val)) {
            ctx.fail(err_createf(ERR_INVALID_REAL, "real value %f has no STEP encoding", attr.real_val));
        }
        break;
    case P21_TYPE_STRING:
        format_string(ctx, attr.text);
        break;
    case P21_TYPE_BINARY:
        // caller supplies the hex digits, no validation here
        ctx.write_char('"');
        ctx.write_text(attr.text);
        ctx.write_char('"');
        break;
    case P21_TYPE_ENUM:
        ctx.write_char('.');
        ctx.write_text(attr.text);
        ctx.write_char('.');
        break;
    case P21_TYPE_BOOL:
        ctx.write_text(attr.bool_val ? ".T." : ".F.");
        break;
    case P21_TYPE_LOGICAL:
        ctx.write_text(attr.logical_val == LOGICAL_TRUE ? ".T." :
            attr.logical_val == LOGICAL_FALSE ? ".F." : ".U.");
        break;
    case P21_TYPE_TYPED:
        ctx.write_text(attr.text);
        ctx.write_char('(');
        if (attr.items.empty()) {
            ctx.fail(err_createf(ERR_INPUT_ERROR, "typed value %s has no inner value", attr.text.c_str()));
            break;
        }
        format_attr(ctx, attr.inner());
        ctx.write_char(')');
        break;
    case P21_TYPE_LIST:
        format_list(ctx, attr.items);
        break;
    case P21_TYPE_REFERENCE:
        format_reference(ctx, attr.entity);
        break;
    default:
        log_error("format_step: unknown attribute type %d", (int)attr.type);
        ctx.fail(err_createf(ERR_INTERNAL_ERROR, "unknown attribute type %d", (int)attr.type));
        break;
    }
}

P21ErrorCode format_step_attribute(StepContext& ctx, const Attribute& attr) {
    if (ctx.failed()) return ctx.error_code();
    format_attr(ctx, attr);
    return ctx.error_code();
}

P21ErrorCode format_step_attributes(StepContext& ctx, const std::vector<Attribute>& attrs) {
    for (size_t i = 0; i < attrs.size() && !ctx.failed(); i++) {
        if (i > 0) ctx.write_char(',');
        format_attr(ctx, attrs[i]);
    }
    return ctx.error_code();
}

std::string format_step_value(const Attribute& attr, EncodeMode mode) {
    StrBuf* sb = strbuf_new();
    if (!sb) return std::string();

    StepContext ctx(sb, nullptr, mode);
    std::string result;
    if (format_step_attribute(ctx, attr) == ERR_OK) {
        result.assign(sb->str, sb->length);
    } else {
        err_log(ctx.error());
    }
    strbuf_free(sb);
    return result;
}

} // namespace p21
