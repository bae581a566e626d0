#ifndef P21_STEP_NAME_H
#define P21_STEP_NAME_H

#include <string>

namespace p21 {

// Upper-case a type or enumeration name and strip surrounding whitespace.
// Characters that do not decode as UTF-8 are copied through unchanged.
std::string normalize_name(const std::string& name);

// True when every character of name is an upper-case letter, digit or '_'
// and the name starts with a letter (the EXPRESS keyword form).
bool is_normalized_name(const std::string& name);

} // namespace p21

#endif // P21_STEP_NAME_H
