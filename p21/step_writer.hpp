#ifndef P21_STEP_WRITER_HPP
#define P21_STEP_WRITER_HPP

#include "p21-data.hpp"
#include "p21_error.h"
#include "entity_compiler.hpp"
#include "step_header.hpp"
#include "format/step_encoder.hpp"
#include "../lib/strbuf.h"
#include <string>
#include <vector>

namespace p21 {

struct WriterOptions {
    EncodeMode encode_mode = ENCODE_STRICT;
    bool fill_time_stamp = true;    // use the current UTC time when header.time_stamp is empty
};

// "TYPE(attrs);" lines, one per record, in id order
void format_header_section(StrBuf* sb, const EntityTable& table);

// "#id=TYPE(attrs);" lines, one per record, in id order
void format_data_section(StrBuf* sb, const EntityTable& table);

/**
 * Render a complete ISO 10303-21 document
 *
 * Header and data are compiled through separate entity tables. On failure
 * *out is left untouched and *error (when non-null) receives an error the
 * caller must err_free.
 */
P21ErrorCode write_step(const FileHeader& header, const std::vector<Entity*>& roots,
                        const WriterOptions& options, std::string* out, P21Error** error);

// write_step, then store the text at path
P21ErrorCode write_step_file(const char* path, const FileHeader& header, const std::vector<Entity*>& roots,
                             const WriterOptions& options, P21Error** error);

} // namespace p21

#endif // P21_STEP_WRITER_HPP
