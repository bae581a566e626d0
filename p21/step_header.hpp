#ifndef P21_STEP_HEADER_HPP
#define P21_STEP_HEADER_HPP

#include "p21-data.hpp"
#include <time.h>
#include <string>
#include <vector>

namespace p21 {

// Descriptive fields of the HEADER section
struct FileHeader {
    std::vector<std::string> description;
    std::string implementation_level = "2;1";
    std::string name;
    std::string time_stamp;                     // ISO 8601
    std::vector<std::string> author;
    std::vector<std::string> organization;
    std::string preprocessor_version;
    std::string originating_system;
    std::string authorization;
    std::vector<std::string> schema_identifiers;
};

// Create FILE_DESCRIPTION, FILE_NAME and FILE_SCHEMA in model, in that order
std::vector<Entity*> build_header_entities(StepModel& model, const FileHeader& header);

// "YYYY-MM-DDTHH:MM:SS" in UTC
std::string format_time_stamp(time_t when);

} // namespace p21

#endif // P21_STEP_HEADER_HPP
