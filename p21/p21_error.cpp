/**
 * @file p21_error.cpp
 * @brief p21 Structured Error Handling Implementation
 */

#include "p21_error.h"
#include "../lib/log.h"
#include "../lib/strbuf.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <stdarg.h>

// ============================================================================
// Helper: string duplication (portable replacement for strdup)
// ============================================================================

static char* err_strdup(const char* s) {
    if (!s) return NULL;
    size_t len = strlen(s) + 1;
    char* copy = (char*)malloc(len);
    if (copy) memcpy(copy, s, len);
    return copy;
}

// ============================================================================
// Error Code Name Lookup
// ============================================================================

typedef struct {
    P21ErrorCode code;
    const char* name;
    const char* message;
} ErrorCodeInfo;

static const ErrorCodeInfo error_code_table[] = {
    {ERR_OK, "OK", "Success"},

    // 1xx - Input Errors
    {ERR_INPUT_ERROR, "INPUT_ERROR", "Input error"},
    {ERR_UNREPRESENTABLE_CHARACTER, "UNREPRESENTABLE_CHARACTER", "Character has no STEP string encoding"},
    {ERR_INVALID_REAL, "INVALID_REAL", "Real value has no STEP encoding"},
    {ERR_NULL_REFERENCE, "NULL_REFERENCE", "Reference attribute has no target entity"},
    {ERR_INVALID_ESCAPE, "INVALID_ESCAPE", "Invalid escape sequence"},
    {ERR_INVALID_ARGUMENT, "INVALID_ARGUMENT", "Invalid argument"},

    // 2xx - Structural Errors
    {ERR_STRUCTURE_ERROR, "STRUCTURE_ERROR", "Entity graph error"},
    {ERR_CIRCULAR_REFERENCE, "CIRCULAR_REFERENCE", "Circular entity reference detected"},

    // 4xx - I/O Errors
    {ERR_IO_ERROR, "IO_ERROR", "I/O error"},
    {ERR_FILE_WRITE_ERROR, "FILE_WRITE_ERROR", "File write error"},

    // 5xx - Internal Errors
    {ERR_INTERNAL_ERROR, "INTERNAL_ERROR", "Internal error"},
    {ERR_OUT_OF_MEMORY, "OUT_OF_MEMORY", "Out of memory"},
};

static const int error_code_count = sizeof(error_code_table) / sizeof(error_code_table[0]);

const char* err_code_name(P21ErrorCode code) {
    for (int i = 0; i < error_code_count; i++) {
        if (error_code_table[i].code == code) {
            return error_code_table[i].name;
        }
    }
    return "UNKNOWN_ERROR";
}

const char* err_code_message(P21ErrorCode code) {
    for (int i = 0; i < error_code_count; i++) {
        if (error_code_table[i].code == code) {
            return error_code_table[i].message;
        }
    }
    return "Unknown error";
}

const char* err_category_name(P21ErrorCode code) {
    if (code == ERR_OK) return "None";
    if (ERR_IS_INPUT(code)) return "Input";
    if (ERR_IS_STRUCTURE(code)) return "Structure";
    if (ERR_IS_IO(code)) return "I/O";
    if (ERR_IS_INTERNAL(code)) return "Internal";
    return "Unknown";
}

// ============================================================================
// Error Creation
// ============================================================================

P21Error* err_create(P21ErrorCode code, const char* message) {
    P21Error* error = (P21Error*)calloc(1, sizeof(P21Error));
    if (!error) return NULL;

    error->code = code;
    error->message = message ? err_strdup(message) : err_strdup(err_code_message(code));
    return error;
}

P21Error* err_createf(P21ErrorCode code, const char* format, ...) {
    StrBuf* sb = strbuf_new();
    if (!sb) return NULL;
    va_list args;
    va_start(args, format);
    strbuf_vappend_format(sb, format, args);
    va_end(args);

    P21Error* error = err_create(code, sb->str);
    strbuf_free(sb);
    return error;
}

void err_add_help(P21Error* error, const char* help) {
    if (!error || !help) return;
    if (error->help) free(error->help);
    error->help = err_strdup(help);
}

void err_set_cause(P21Error* error, P21Error* cause) {
    if (!error) return;
    if (error->cause && error->cause != cause) err_free(error->cause);
    error->cause = cause;
}

void err_free(P21Error* error) {
    while (error) {
        P21Error* cause = error->cause;
        free(error->message);
        free(error->help);
        free(error);
        error = cause;
    }
}

// ============================================================================
// Error Formatting
// ============================================================================

void err_format(StrBuf* sb, const P21Error* error) {
    if (!sb || !error) return;
    strbuf_append_format(sb, "error[E%d]: %s", (int)error->code,
        error->message ? error->message : err_code_message(error->code));
    if (error->help) {
        strbuf_append_format(sb, "\n  help: %s", error->help);
    }
    for (const P21Error* cause = error->cause; cause; cause = cause->cause) {
        strbuf_append_format(sb, "\n  caused by: error[E%d]: %s", (int)cause->code,
            cause->message ? cause->message : err_code_message(cause->code));
    }
}

void err_log(const P21Error* error) {
    if (!error) return;
    StrBuf* sb = strbuf_new();
    if (!sb) return;
    err_format(sb, error);
    log_error("%s", sb->str);
    strbuf_free(sb);
}
