#ifndef P21_DATA_HPP
#define P21_DATA_HPP

#include "p21.h"
#include <stdint.h>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace p21 {

struct Entity;

/**
 * Attribute - one value slot of an entity
 *
 * A tagged value; which payload field is live depends on `type`:
 * - P21_TYPE_INTEGER:   int_val
 * - P21_TYPE_REAL:      real_val
 * - P21_TYPE_BOOL:      bool_val
 * - P21_TYPE_LOGICAL:   logical_val
 * - P21_TYPE_REFERENCE: entity (not owned, lives in the StepModel)
 * - P21_TYPE_STRING, P21_TYPE_BINARY, P21_TYPE_ENUM: text
 * - P21_TYPE_TYPED:     text is the type name, items[0] the wrapped value
 * - P21_TYPE_LIST:      items
 */
struct Attribute {
    AttrType type;
    union {
        int64_t int_val;
        double real_val;
        bool bool_val;
        Logical logical_val;
        Entity* entity;
    };
    std::string text;
    std::vector<Attribute> items;

    Attribute() : type(P21_TYPE_NULL), int_val(0) {}

    // wrapped value of a P21_TYPE_TYPED attribute
    const Attribute& inner() const { return items.front(); }
};

// Attribute constructors. Enumeration and type names are normalized to upper case.
Attribute attr_null();
Attribute attr_derived();
Attribute attr_int(int64_t value);
Attribute attr_real(double value);
Attribute attr_string(const std::string& value);
Attribute attr_binary(const std::string& hex_digits);
Attribute attr_enum(const std::string& name);
Attribute attr_bool(bool value);
Attribute attr_logical(Logical value);
Attribute attr_typed(const std::string& type_name, Attribute inner);
Attribute attr_list(std::initializer_list<Attribute> items);
Attribute attr_list(std::vector<Attribute> items);
Attribute attr_string_list(const std::vector<std::string>& values);
Attribute attr_ref(Entity* entity);

/**
 * Entity - a typed, attribute-bearing record
 *
 * Entities have no identity of their own; the compiler gives two entities
 * the same id when they render to the same text.
 */
struct Entity {
    std::string type_name;
    std::vector<Attribute> attrs;
};

/**
 * StepModel - owner of the entity values of one file
 *
 * MEMORY MODEL:
 * - entities are heap-allocated and owned by the model for its whole lifetime
 * - Attribute::entity pointers refer to entities of the same model
 * - roots() keeps the order in which top-level entities were added
 *
 * USAGE PATTERN:
 *   StepModel model;
 *   Entity* pt = model.entity("cartesian_point",
 *       {attr_string(""), attr_list({attr_real(0), attr_real(0), attr_real(0)})});
 *   model.root("vertex_point", {attr_string(""), attr_ref(pt)});
 */
class StepModel {
public:
    StepModel() = default;

    StepModel(const StepModel&) = delete;
    StepModel& operator=(const StepModel&) = delete;
    StepModel(StepModel&&) = default;
    StepModel& operator=(StepModel&&) = default;

    // create an entity owned by the model (type name is normalized)
    Entity* entity(const std::string& type_name, std::initializer_list<Attribute> attrs);
    Entity* entity(const std::string& type_name, std::vector<Attribute> attrs);

    // create an entity and append it to the root list
    Entity* root(const std::string& type_name, std::initializer_list<Attribute> attrs);
    Entity* root(const std::string& type_name, std::vector<Attribute> attrs);

    // append an existing entity of this model to the root list
    void add_root(Entity* entity);

    const std::vector<Entity*>& roots() const { return roots_; }

private:
    std::vector<std::unique_ptr<Entity>> entities_;
    std::vector<Entity*> roots_;
};

} // namespace p21

#endif // P21_DATA_HPP
