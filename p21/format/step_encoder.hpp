#pragma once

#include <string>
#include <string_view>
#include "../../lib/strbuf.h"
#include "../p21_error.h"

namespace p21 {

// What to do with a character that has no STEP string encoding
enum EncodeMode {
    ENCODE_STRICT,   // report ERR_UNREPRESENTABLE_CHARACTER
    ENCODE_LENIENT,  // drop the character silently
};

/**
 * STEP simple-string encoder (ISO 10303-21 string escaping)
 *
 * Input is UTF-8. Per character:
 * - ' → ''
 * - \ → \ (passed through)
 * - U+0020..U+007E → itself
 * - U+0000..U+001F, U+007F..U+00FF → \X\hh
 * - U+0100..U+FFFF → \X2\hhhh\X0\
 * - U+10000..U+10FFFF → \X4\hhhhhhhh\X0\
 *
 * The delimiting quotes are not written; callers wrap the result.
 */
class StepEncoder {
public:
    /**
     * Append the escaped form of text to sb
     *
     * @param sb Output buffer
     * @param text UTF-8 text
     * @param mode Handling of bytes that do not decode as UTF-8
     * @param error_offset If non-null, receives the byte offset of the
     *                     offending character on failure
     * @return ERR_OK, or ERR_UNREPRESENTABLE_CHARACTER in strict mode
     */
    static P21ErrorCode encode(StrBuf* sb, std::string_view text,
                               EncodeMode mode = ENCODE_STRICT, size_t* error_offset = nullptr);

    /**
     * Escape text, dropping anything unrepresentable
     *
     * @param text UTF-8 text
     * @return Escaped text without quotes
     */
    static std::string encode(std::string_view text);

    /**
     * Decode an escaped string body (without its delimiting quotes) to UTF-8
     *
     * Recognizes '', \X\hh, \X2\...\X0\, \X4\...\X0\ and \S\c; any other
     * backslash is literal.
     *
     * @return ERR_OK, or ERR_INVALID_ESCAPE for a malformed directive or an
     *         unpaired apostrophe
     */
    static P21ErrorCode decode(StrBuf* sb, std::string_view text, size_t* error_offset = nullptr);

    /**
     * Check if text needs escaping
     * Fast pre-check to avoid running the full encoder
     */
    static bool needs_escaping(std::string_view text);

    // directive that closes a \X2\ or \X4\ run
    static constexpr const char* X0_END = "\\X0\\";
};

} // namespace p21
