/**
 * @file p21_error.h
 * @brief p21 Structured Error Handling
 *
 * Error codes and owned error records shared by the encoder, the entity
 * compiler and the file writer.
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

#include "../lib/strbuf.h"

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Error Code Ranges
// ============================================================================

#define ERR_INPUT_BASE      100
#define ERR_STRUCTURE_BASE  200
#define ERR_IO_BASE         400
#define ERR_INTERNAL_BASE   500

// Category macros
#define ERR_IS_INPUT(code)      ((code) >= 100 && (code) < 200)
#define ERR_IS_STRUCTURE(code)  ((code) >= 200 && (code) < 300)
#define ERR_IS_IO(code)         ((code) >= 400 && (code) < 500)
#define ERR_IS_INTERNAL(code)   ((code) >= 500 && (code) < 600)

// ============================================================================
// Error Codes
// ============================================================================

typedef enum P21ErrorCode {
    // Success
    ERR_OK = 0,

    // -------------------------------------------------------------------------
    // 1xx - Input Errors (values that have no STEP encoding)
    // -------------------------------------------------------------------------
    ERR_INPUT_ERROR = 100,                // generic input error
    ERR_UNREPRESENTABLE_CHARACTER = 101,  // character outside the encodable planes / invalid UTF-8
    ERR_INVALID_REAL = 102,               // NaN or infinite real value
    ERR_NULL_REFERENCE = 103,             // reference attribute without a target entity
    ERR_INVALID_ESCAPE = 104,             // malformed escape directive while decoding
    ERR_INVALID_ARGUMENT = 105,           // bad command-line or API argument

    // -------------------------------------------------------------------------
    // 2xx - Structural Errors (entity graph)
    // -------------------------------------------------------------------------
    ERR_STRUCTURE_ERROR = 200,            // generic structural error
    ERR_CIRCULAR_REFERENCE = 201,         // entity reachable from itself

    // -------------------------------------------------------------------------
    // 4xx - I/O Errors
    // -------------------------------------------------------------------------
    ERR_IO_ERROR = 400,                   // generic I/O error
    ERR_FILE_WRITE_ERROR = 404,           // error writing file

    // -------------------------------------------------------------------------
    // 5xx - Internal Errors
    // -------------------------------------------------------------------------
    ERR_INTERNAL_ERROR = 500,             // generic internal error
    ERR_OUT_OF_MEMORY = 509,              // allocation failure

} P21ErrorCode;

// ============================================================================
// P21 Error Structure
// ============================================================================

typedef struct P21Error {
    P21ErrorCode code;          // error code (e.g., 201)
    char* message;              // human-readable message (owned)
    char* help;                 // suggestion text (owned, optional)
    struct P21Error* cause;     // chained error (owned, optional)
} P21Error;

// ============================================================================
// Error Code Info
// ============================================================================

const char* err_code_name(P21ErrorCode code);
const char* err_code_message(P21ErrorCode code);
const char* err_category_name(P21ErrorCode code);

// ============================================================================
// Error Creation / Destruction
// ============================================================================

// message may be NULL, in which case the default message of the code is used
P21Error* err_create(P21ErrorCode code, const char* message);
P21Error* err_createf(P21ErrorCode code, const char* format, ...);
void err_add_help(P21Error* error, const char* help);
void err_set_cause(P21Error* error, P21Error* cause);
void err_free(P21Error* error);

// ============================================================================
// Error Formatting
// ============================================================================

// "error[E201]: <message>" followed by help and cause lines
void err_format(StrBuf* sb, const P21Error* error);

// format and log at error level
void err_log(const P21Error* error);

#ifdef __cplusplus
}
#endif
