#ifndef P21_ENTITY_COMPILER_HPP
#define P21_ENTITY_COMPILER_HPP

#include "p21-data.hpp"
#include "p21_error.h"
#include "format/format.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace p21 {

// One numbered record of the DATA section
struct CompiledEntity {
    int id;
    std::string type_name;
    std::string attrs;      // comma-joined attribute text, no enclosing parentheses
};

/**
 * EntityTable - hash-cons table of rendered entities
 *
 * Maps the rendered body "TYPE(attrs)" to its id. ids are dense, start at 1
 * and follow insertion order; records()[id - 1] is the record of id.
 */
class EntityTable {
public:
    // id of the body, adding a new record when the body has not been seen
    int intern(const std::string& type_name, const std::string& attrs, bool* added = nullptr);

    // id of a rendered body "TYPE(attrs)", 0 when absent
    int lookup(const std::string& body) const;

    const CompiledEntity* get(int id) const;
    const std::vector<CompiledEntity>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    void clear();

private:
    std::unordered_map<std::string, int> index_;
    std::vector<CompiledEntity> records_;
};

/**
 * EntityCompiler - flattens an entity forest into an EntityTable
 *
 * Each entity is compiled after every entity it references, so a child gets
 * a lower id than the parent that first references it. Entities rendering
 * to the same text share one id. The walk keeps its own stack, so the depth
 * of reference chains is not limited by the call stack.
 *
 * A reference cycle fails the whole compile with ERR_CIRCULAR_REFERENCE;
 * cycle() then lists the entities of the cycle, starting and ending with
 * the entity that was re-entered.
 */
class EntityCompiler : public ReferenceResolver {
public:
    explicit EntityCompiler(EncodeMode mode = ENCODE_STRICT);
    ~EntityCompiler() override;

    EntityCompiler(const EntityCompiler&) = delete;
    EntityCompiler& operator=(const EntityCompiler&) = delete;

    /**
     * Compile the roots in order into a fresh table
     *
     * On failure the table is left empty and error() describes the problem.
     */
    P21ErrorCode compile(const std::vector<Entity*>& roots);

    // compile one entity (and everything it references) into the current
    // table; returns its id, or 0 on failure
    int compile_entity(const Entity* entity);

    int resolve_reference(const Entity* entity) override;

    const EntityTable& table() const { return table_; }
    const std::vector<int>& root_ids() const { return root_ids_; }
    const std::vector<const Entity*>& cycle() const { return cycle_; }
    EncodeMode encode_mode() const { return mode_; }

    const P21Error* error() const { return error_; }
    P21ErrorCode error_code() const { return error_ ? error_->code : ERR_OK; }

    // hand the error over to the caller (who must err_free it)
    P21Error* take_error();

    // forget the table and all per-call state
    void reset();

private:
    struct Frame {
        const Entity* entity;
        std::vector<const Entity*> refs;   // referenced entities in rendering order
        size_t next;
    };

    void push_frame(std::vector<Frame>& stack, const Entity* entity);
    int emit(const Entity* entity);
    void fail(P21Error* error);
    void fail_cycle(const std::vector<Frame>& stack, const Entity* entity);

    EncodeMode mode_;
    EntityTable table_;
    std::vector<int> root_ids_;
    std::unordered_map<const Entity*, int> resolved_;       // entity → id within this call
    std::unordered_map<const Entity*, size_t> compiling_;   // entity → stack depth
    std::vector<const Entity*> cycle_;
    P21Error* error_;
};

} // namespace p21

#endif // P21_ENTITY_COMPILER_HPP
