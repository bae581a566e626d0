#include "step_encoder.hpp"
#include "../../lib/log.h"
#include <utf8proc.h>

namespace p21 {

static const char HEX_DIGITS[] = "0123456789ABCDEF";

// append value as exactly `width` upper-case hex digits, most significant first
static void append_hex(StrBuf* sb, uint32_t value, int width) {
    char hex_buf[8];
    for (int i = width - 1; i >= 0; i--) {
        hex_buf[i] = HEX_DIGITS[value & 0xF];
        value >>= 4;
    }
    strbuf_append_str_n(sb, hex_buf, (size_t)width);
}

static void encode_codepoint(StrBuf* sb, uint32_t cp) {
    if (cp == '\'') {
        strbuf_append_str(sb, "''");
    } else if (cp == '\\') {
        strbuf_append_char(sb, '\\');
    } else if (cp >= 0x20 && cp <= 0x7E) {
        strbuf_append_char(sb, (char)cp);
    } else if (cp <= 0xFF) {
        // control characters and the upper half of ISO 8859-1
        strbuf_append_str(sb, "\\X\\");
        append_hex(sb, cp, 2);
    } else if (cp <= 0xFFFF) {
        strbuf_append_str(sb, "\\X2\\");
        append_hex(sb, cp, 4);
        strbuf_append_str(sb, StepEncoder::X0_END);
    } else {
        strbuf_append_str(sb, "\\X4\\");
        append_hex(sb, cp, 8);
        strbuf_append_str(sb, StepEncoder::X0_END);
    }
}

P21ErrorCode StepEncoder::encode(StrBuf* sb, std::string_view text, EncodeMode mode, size_t* error_offset) {
    const utf8proc_uint8_t* str = (const utf8proc_uint8_t*)text.data();
    size_t len = text.length();
    size_t pos = 0;

    while (pos < len) {
        unsigned char c = (unsigned char)text[pos];
        if (c < 0x80) {
            encode_codepoint(sb, c);
            pos++;
            continue;
        }

        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes_read = utf8proc_iterate(str + pos, (utf8proc_ssize_t)(len - pos), &codepoint);
        if (bytes_read <= 0 || codepoint < 0 || codepoint > 0x10FFFF) {
            if (mode == ENCODE_STRICT) {
                log_debug("step_encoder: unrepresentable byte 0x%02X at offset %zu", c, pos);
                if (error_offset) *error_offset = pos;
                return ERR_UNREPRESENTABLE_CHARACTER;
            }
            pos++;
            continue;
        }

        encode_codepoint(sb, (uint32_t)codepoint);
        pos += (size_t)bytes_read;
    }
    return ERR_OK;
}

std::string StepEncoder::encode(std::string_view text) {
    if (!needs_escaping(text)) {
        return std::string(text);
    }

    StrBuf* sb = strbuf_new_cap(text.length() + text.length() / 4 + 1);
    if (!sb) return std::string();
    encode(sb, text, ENCODE_LENIENT, nullptr);
    std::string result(sb->str, sb->length);
    strbuf_free(sb);
    return result;
}

bool StepEncoder::needs_escaping(std::string_view text) {
    for (char ch : text) {
        unsigned char c = (unsigned char)ch;
        if (c == '\'' || c < 0x20 || c > 0x7E) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Decoding
// ============================================================================

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

// parse exactly `width` hex digits at text[pos]
static bool parse_hex(std::string_view text, size_t pos, int width, uint32_t* value) {
    if (pos + (size_t)width > text.length()) return false;
    uint32_t result = 0;
    for (int i = 0; i < width; i++) {
        int digit = hex_value(text[pos + i]);
        if (digit < 0) return false;
        result = (result << 4) | (uint32_t)digit;
    }
    *value = result;
    return true;
}

static bool append_codepoint(StrBuf* sb, uint32_t cp) {
    if (!utf8proc_codepoint_valid((utf8proc_int32_t)cp)) return false;
    utf8proc_uint8_t encoded[4];
    utf8proc_ssize_t n = utf8proc_encode_char((utf8proc_int32_t)cp, encoded);
    strbuf_append_str_n(sb, (const char*)encoded, (size_t)n);
    return true;
}

static bool starts_with(std::string_view text, size_t pos, const char* prefix) {
    return text.compare(pos, strlen(prefix), prefix) == 0;
}

// decode a \X2\ or \X4\ run starting after the opening directive; returns the
// position just past the closing \X0\, or npos when malformed
static size_t decode_wide_run(StrBuf* sb, std::string_view text, size_t pos, int width) {
    while (pos < text.length()) {
        if (starts_with(text, pos, StepEncoder::X0_END)) {
            return pos + 4;
        }
        uint32_t cp;
        if (!parse_hex(text, pos, width, &cp) || !append_codepoint(sb, cp)) {
            return std::string_view::npos;
        }
        pos += (size_t)width;
    }
    return std::string_view::npos;
}

P21ErrorCode StepEncoder::decode(StrBuf* sb, std::string_view text, size_t* error_offset) {
    size_t len = text.length();
    size_t pos = 0;

    while (pos < len) {
        char c = text[pos];
        if (c == '\'') {
            if (pos + 1 < len && text[pos + 1] == '\'') {
                strbuf_append_char(sb, '\'');
                pos += 2;
                continue;
            }
            log_debug("step_encoder: unpaired apostrophe at offset %zu", pos);
            if (error_offset) *error_offset = pos;
            return ERR_INVALID_ESCAPE;
        }
        if (c != '\\') {
            strbuf_append_char(sb, c);
            pos++;
            continue;
        }

        size_t next = std::string_view::npos;
        if (starts_with(text, pos, "\\X\\")) {
            uint32_t cp;
            if (parse_hex(text, pos + 3, 2, &cp) && append_codepoint(sb, cp)) {
                next = pos + 5;
            }
        } else if (starts_with(text, pos, "\\X2\\")) {
            next = decode_wide_run(sb, text, pos + 4, 4);
        } else if (starts_with(text, pos, "\\X4\\")) {
            next = decode_wide_run(sb, text, pos + 4, 8);
        } else if (starts_with(text, pos, "\\S\\")) {
            if (pos + 3 < len) {
                unsigned char base = (unsigned char)text[pos + 3];
                if (base >= 0x20 && base <= 0x7E && append_codepoint(sb, (uint32_t)base + 0x80)) {
                    next = pos + 4;
                }
            }
        } else {
            // not a directive
            strbuf_append_char(sb, '\\');
            pos++;
            continue;
        }

        if (next == std::string_view::npos) {
            log_debug("step_encoder: malformed escape directive at offset %zu", pos);
            if (error_offset) *error_offset = pos;
            return ERR_INVALID_ESCAPE;
        }
        pos = next;
    }
    return ERR_OK;
}

} // namespace p21
