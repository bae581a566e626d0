#include "step_header.hpp"

namespace p21 {

std::vector<Entity*> build_header_entities(StepModel& model, const FileHeader& header) {
    std::vector<Entity*> entities;

    entities.push_back(model.entity("FILE_DESCRIPTION", {
        attr_string_list(header.description),
        attr_string(header.implementation_level),
    }));

    entities.push_back(model.entity("FILE_NAME", {
        attr_string(header.name),
        attr_string(header.time_stamp),
        attr_string_list(header.author),
        attr_string_list(header.organization),
        attr_string(header.preprocessor_version),
        attr_string(header.originating_system),
        attr_string(header.authorization),
    }));

    entities.push_back(model.entity("FILE_SCHEMA", {
        attr_string_list(header.schema_identifiers),
    }));

    return entities;
}

std::string format_time_stamp(time_t when) {
    struct tm tm_utc;
#if defined(_WIN32)
    gmtime_s(&tm_utc, &when);
#else
    gmtime_r(&when, &tm_utc);
#endif
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    return std::string(stamp);
}

} // namespace p21
