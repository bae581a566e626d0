#pragma once

#include <stdint.h>
#include <stdbool.h>

#define P21_VERSION_MAJOR 1
#define P21_VERSION_MINOR 0
#define P21_VERSION_STRING "1.0"

// STEP physical file delimiters (ISO 10303-21)
#define P21_FILE_BEGIN   "ISO-10303-21;"
#define P21_FILE_END     "END-ISO-10303-21;"
#define P21_HEADER_BEGIN "HEADER;"
#define P21_DATA_BEGIN   "DATA;"
#define P21_SECTION_END  "ENDSEC;"

/*
 Attribute value kinds:
 - for simple scalar kinds: P21_TYPE_NULL, P21_TYPE_DERIVED, P21_TYPE_BOOL, P21_TYPE_LOGICAL,
   P21_TYPE_INTEGER, P21_TYPE_REAL
 - for text kinds: P21_TYPE_STRING (escaped), P21_TYPE_BINARY (pre-encoded hex), P21_TYPE_ENUM
 - for compound kinds: P21_TYPE_TYPED (SELECT wrapper around one inner value), P21_TYPE_LIST
 - P21_TYPE_REFERENCE points to another entity, rendered as #id once compiled
*/
enum EnumAttrType {
    P21_TYPE_NULL = 0,   // $
    P21_TYPE_DERIVED,    // *
    P21_TYPE_INTEGER,
    P21_TYPE_REAL,
    P21_TYPE_STRING,
    P21_TYPE_BINARY,
    P21_TYPE_ENUM,
    P21_TYPE_BOOL,
    P21_TYPE_LOGICAL,
    P21_TYPE_TYPED,
    P21_TYPE_LIST,
    P21_TYPE_REFERENCE,
    P21_TYPE_COUNT,
};
typedef uint8_t AttrType;

// EXPRESS LOGICAL values
enum EnumLogical {
    LOGICAL_FALSE = 0,
    LOGICAL_TRUE = 1,
    LOGICAL_UNKNOWN = 2,
};
typedef uint8_t Logical;

#ifdef __cplusplus
extern "C" {
#endif

const char* p21_type_name(AttrType type);

#ifdef __cplusplus
}
#endif
