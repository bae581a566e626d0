#ifndef P21_FORMAT_H
#define P21_FORMAT_H

#include "../p21-data.hpp"
#include "../p21_error.h"
#include "../../lib/strbuf.h"
#include "step_encoder.hpp"
#include <string>
#include <vector>

namespace p21 {

// Supplies the integer id of a referenced entity while its parent is rendered
class ReferenceResolver {
public:
    virtual ~ReferenceResolver() = default;

    // id of the entity, or 0 when it has not been compiled
    virtual int resolve_reference(const Entity* entity) = 0;
};

/**
 * StepContext - output and error state for rendering attributes
 *
 * Holds the output buffer, the string encoding mode and the reference
 * resolver. The first failure is kept in error() and stops further output.
 */
class StepContext {
public:
    StepContext(StrBuf* output, ReferenceResolver* resolver, EncodeMode mode = ENCODE_STRICT)
        : output_(output)
        , resolver_(resolver)
        , mode_(mode)
        , error_(nullptr)
    {}

    ~StepContext() { err_free(error_); }

    StepContext(const StepContext&) = delete;
    StepContext& operator=(const StepContext&) = delete;

    StrBuf* output() const { return output_; }
    ReferenceResolver* resolver() const { return resolver_; }
    EncodeMode encode_mode() const { return mode_; }

    bool failed() const { return error_ != nullptr; }
    P21ErrorCode error_code() const { return error_ ? error_->code : ERR_OK; }
    const P21Error* error() const { return error_; }

    // hand the error over to the caller (who must err_free it)
    P21Error* take_error() {
        P21Error* error = error_;
        error_ = nullptr;
        return error;
    }

    // record an error; only the first one is kept
    void fail(P21Error* error) {
        if (!error_) error_ = error;
        else err_free(error);
    }

    inline void write_text(const char* text) {
        if (output_ && text) {
            strbuf_append_str(output_, text);
        }
    }

    inline void write_text(const std::string& text) {
        if (output_ && !text.empty()) {
            strbuf_append_str_n(output_, text.data(), text.length());
        }
    }

    inline void write_char(char c) {
        if (output_) {
            strbuf_append_char(output_, c);
        }
    }

private:
    StrBuf* output_;
    ReferenceResolver* resolver_;
    EncodeMode mode_;
    P21Error* error_;
};

// Append one attribute in its STEP text form
P21ErrorCode format_step_attribute(StepContext& ctx, const Attribute& attr);

// Append attributes comma-joined, without the enclosing parentheses
P21ErrorCode format_step_attributes(StepContext& ctx, const std::vector<Attribute>& attrs);

// Append a real: shortest round-trip digits, always with a decimal point
// (2.0 → "2.", 1e20 → "1.E+20"). Returns false for NaN and infinities.
bool format_step_real(StrBuf* sb, double value);

// Render a single attribute that holds no entity references
// (a reference attribute renders as an error)
std::string format_step_value(const Attribute& attr, EncodeMode mode = ENCODE_STRICT);

} // namespace p21

#endif // P21_FORMAT_H
