#ifndef STRING_BUFFER_H
#define STRING_BUFFER_H

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <stdarg.h>
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct {
    char* str;          // null-terminated while capacity > 0
    size_t length;      // length excluding null terminator
    size_t capacity;    // capacity in bytes, including room for the terminator
} StrBuf;

StrBuf* strbuf_new();
StrBuf* strbuf_new_cap(size_t size);
void strbuf_free(StrBuf *sb);
bool strbuf_ensure_cap(StrBuf *sb, size_t min_capacity);
void strbuf_append_str(StrBuf *sb, const char *str);
// append string of given length n
void strbuf_append_str_n(StrBuf *sb, const char *str, size_t n);
void strbuf_append_char(StrBuf *sb, char c);
void strbuf_append_int64(StrBuf *buf, int64_t value);
void strbuf_append_format(StrBuf *sb, const char *format, ...);
void strbuf_vappend_format(StrBuf *sb, const char *format, va_list args);

#ifdef __cplusplus
}
#endif

#endif
