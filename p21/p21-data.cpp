#include "p21-data.hpp"
#include "step_name.h"
#include <utility>

static const char* const attr_type_names[P21_TYPE_COUNT] = {
    "null", "derived", "integer", "real", "string", "binary",
    "enum", "bool", "logical", "typed", "list", "reference",
};

extern "C" const char* p21_type_name(AttrType type) {
    return type < P21_TYPE_COUNT ? attr_type_names[type] : "unknown";
}

namespace p21 {

Attribute attr_null() {
    return Attribute();
}

Attribute attr_derived() {
    Attribute attr;
    attr.type = P21_TYPE_DERIVED;
    return attr;
}

Attribute attr_int(int64_t value) {
    Attribute attr;
    attr.type = P21_TYPE_INTEGER;
    attr.int_val = value;
    return attr;
}

Attribute attr_real(double value) {
    Attribute attr;
    attr.type = P21_TYPE_REAL;
    attr.real_val = value;
    return attr;
}

Attribute attr_string(const std::string& value) {
    Attribute attr;
    attr.type = P21_TYPE_STRING;
    attr.text = value;
    return attr;
}

Attribute attr_binary(const std::string& hex_digits) {
    Attribute attr;
    attr.type = P21_TYPE_BINARY;
    attr.text = hex_digits;
    return attr;
}

Attribute attr_enum(const std::string& name) {
    Attribute attr;
    attr.type = P21_TYPE_ENUM;
    attr.text = normalize_name(name);
    return attr;
}

Attribute attr_bool(bool value) {
    Attribute attr;
    attr.type = P21_TYPE_BOOL;
    attr.bool_val = value;
    return attr;
}

Attribute attr_logical(Logical value) {
    Attribute attr;
    attr.type = P21_TYPE_LOGICAL;
    attr.logical_val = value;
    return attr;
}

Attribute attr_typed(const std::string& type_name, Attribute inner) {
    Attribute attr;
    attr.type = P21_TYPE_TYPED;
    attr.text = normalize_name(type_name);
    attr.items.push_back(std::move(inner));
    return attr;
}

Attribute attr_list(std::initializer_list<Attribute> items) {
    return attr_list(std::vector<Attribute>(items));
}

Attribute attr_list(std::vector<Attribute> items) {
    Attribute attr;
    attr.type = P21_TYPE_LIST;
    attr.items = std::move(items);
    return attr;
}

Attribute attr_string_list(const std::vector<std::string>& values) {
    std::vector<Attribute> items;
    items.reserve(values.size());
    for (const std::string& value : values) {
        items.push_back(attr_string(value));
    }
    return attr_list(std::move(items));
}

Attribute attr_ref(Entity* entity) {
    Attribute attr;
    attr.type = P21_TYPE_REFERENCE;
    attr.entity = entity;
    return attr;
}

Entity* StepModel::entity(const std::string& type_name, std::initializer_list<Attribute> attrs) {
    return entity(type_name, std::vector<Attribute>(attrs));
}

Entity* StepModel::entity(const std::string& type_name, std::vector<Attribute> attrs) {
    std::unique_ptr<Entity> created(new Entity());
    created->type_name = normalize_name(type_name);
    created->attrs = std::move(attrs);
    entities_.push_back(std::move(created));
    return entities_.back().get();
}

Entity* StepModel::root(const std::string& type_name, std::initializer_list<Attribute> attrs) {
    Entity* created = entity(type_name, attrs);
    roots_.push_back(created);
    return created;
}

Entity* StepModel::root(const std::string& type_name, std::vector<Attribute> attrs) {
    Entity* created = entity(type_name, std::move(attrs));
    roots_.push_back(created);
    return created;
}

void StepModel::add_root(Entity* entity) {
    if (entity) roots_.push_back(entity);
}

} // namespace p21
