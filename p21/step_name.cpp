#include "step_name.h"
#include "../lib/log.h"
#include <ctype.h>
#include <utf8proc.h>

namespace p21 {

std::string normalize_name(const std::string& name) {
    size_t start = 0;
    size_t end = name.size();
    while (start < end && isspace((unsigned char)name[start])) start++;
    while (end > start && isspace((unsigned char)name[end - 1])) end--;

    std::string result;
    result.reserve(end - start);

    const utf8proc_uint8_t* str = (const utf8proc_uint8_t*)name.data();
    size_t pos = start;
    while (pos < end) {
        unsigned char c = (unsigned char)name[pos];
        if (c < 0x80) {
            // ASCII fast path
            result += (char)toupper(c);
            pos++;
            continue;
        }

        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes_read = utf8proc_iterate(str + pos, (utf8proc_ssize_t)(end - pos), &codepoint);
        if (bytes_read <= 0) {
            log_debug("normalize_name: invalid UTF-8 byte 0x%02X at offset %zu in '%s'", c, pos, name.c_str());
            result += (char)c;
            pos++;
            continue;
        }

        utf8proc_uint8_t encoded[4];
        utf8proc_ssize_t encoded_len = utf8proc_encode_char(utf8proc_toupper(codepoint), encoded);
        result.append((const char*)encoded, (size_t)encoded_len);
        pos += (size_t)bytes_read;
    }
    return result;
}

bool is_normalized_name(const std::string& name) {
    if (name.empty() || !(name[0] >= 'A' && name[0] <= 'Z')) return false;
    for (char c : name) {
        if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_')) {
            return false;
        }
    }
    return true;
}

} // namespace p21
