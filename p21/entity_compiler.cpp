#include "entity_compiler.hpp"
#include "step_name.h"
#include "../lib/log.h"
#include <utility>

namespace p21 {

// ============================================================================
// EntityTable
// ============================================================================

int EntityTable::intern(const std::string& type_name, const std::string& attrs, bool* added) {
    std::string body;
    body.reserve(type_name.length() + attrs.length() + 2);
    body += type_name;
    body += '(';
    body += attrs;
    body += ')';

    auto found = index_.find(body);
    if (found != index_.end()) {
        if (added) *added = false;
        return found->second;
    }

    int id = (int)records_.size() + 1;
    records_.push_back(CompiledEntity{id, type_name, attrs});
    index_.emplace(std::move(body), id);
    if (added) *added = true;
    return id;
}

int EntityTable::lookup(const std::string& body) const {
    auto found = index_.find(body);
    return found != index_.end() ? found->second : 0;
}

const CompiledEntity* EntityTable::get(int id) const {
    if (id < 1 || (size_t)id > records_.size()) return nullptr;
    return &records_[(size_t)id - 1];
}

void EntityTable::clear() {
    index_.clear();
    records_.clear();
}

// ============================================================================
// EntityCompiler
// ============================================================================

// references in the order the formatter will reach them
static void collect_refs(const Attribute& attr, std::vector<const Entity*>& refs) {
    switch (attr.type) {
    case P21_TYPE_REFERENCE:
        refs.push_back(attr.entity);
        break;
    case P21_TYPE_TYPED:
    case P21_TYPE_LIST:
        for (const Attribute& item : attr.items) {
            collect_refs(item, refs);
        }
        break;
    default:
        break;
    }
}

EntityCompiler::EntityCompiler(EncodeMode mode)
    : mode_(mode)
    , error_(nullptr)
{}

EntityCompiler::~EntityCompiler() {
    err_free(error_);
}

void EntityCompiler::reset() {
    table_.clear();
    root_ids_.clear();
    resolved_.clear();
    compiling_.clear();
    cycle_.clear();
    err_free(error_);
    error_ = nullptr;
}

P21Error* EntityCompiler::take_error() {
    P21Error* error = error_;
    error_ = nullptr;
    return error;
}

void EntityCompiler::fail(P21Error* error) {
    if (!error_) error_ = error;
    else err_free(error);
}

P21ErrorCode EntityCompiler::compile(const std::vector<Entity*>& roots) {
    reset();
    log_debug("entity_compiler: compiling %zu roots", roots.size());

    for (const Entity* root : roots) {
        int id = compile_entity(root);
        if (id == 0) {
            // no partial output
            table_.clear();
            root_ids_.clear();
            resolved_.clear();
            err_log(error_);
            // the error record itself may have failed to allocate
            return error_ ? error_->code : ERR_OUT_OF_MEMORY;
        }
        root_ids_.push_back(id);
    }

    log_debug("entity_compiler: %zu roots compiled into %zu entities", roots.size(), table_.size());
    return ERR_OK;
}

void EntityCompiler::push_frame(std::vector<Frame>& stack, const Entity* entity) {
    Frame frame;
    frame.entity = entity;
    frame.next = 0;
    for (const Attribute& attr : entity->attrs) {
        collect_refs(attr, frame.refs);
    }
    compiling_[entity] = stack.size();
    stack.push_back(std::move(frame));
}

void EntityCompiler::fail_cycle(const std::vector<Frame>& stack, const Entity* entity) {
    cycle_.clear();
    for (size_t i = compiling_[entity]; i < stack.size(); i++) {
        cycle_.push_back(stack[i].entity);
    }
    cycle_.push_back(entity);

    P21Error* error;
    StrBuf* chain = strbuf_new();
    if (chain) {
        for (size_t i = 0; i < cycle_.size(); i++) {
            if (i > 0) strbuf_append_str(chain, " -> ");
            strbuf_append_str_n(chain, cycle_[i]->type_name.data(), cycle_[i]->type_name.length());
        }
        error = err_createf(ERR_CIRCULAR_REFERENCE, "circular entity reference: %s", chain->str);
        strbuf_free(chain);
    } else {
        // no room for the chain text, the cycle itself is still recorded
        error = err_create(ERR_CIRCULAR_REFERENCE, NULL);
    }
    err_add_help(error, "entity graphs written to a STEP file must be acyclic");
    fail(error);
}

int EntityCompiler::compile_entity(const Entity* entity) {
    if (!entity) {
        fail(err_create(ERR_NULL_REFERENCE, "root entity is null"));
        return 0;
    }
    auto done = resolved_.find(entity);
    if (done != resolved_.end()) return done->second;

    std::vector<Frame> stack;
    push_frame(stack, entity);

    while (!stack.empty()) {
        Frame& frame = stack.back();
        if (frame.next < frame.refs.size()) {
            const Entity* child = frame.refs[frame.next++];
            if (!child) {
                fail(err_createf(ERR_NULL_REFERENCE, "%s has a reference attribute without a target",
                    frame.entity->type_name.c_str()));
                break;
            }
            if (resolved_.count(child)) continue;
            if (compiling_.count(child)) {
                fail_cycle(stack, child);
                break;
            }
            push_frame(stack, child);
            continue;
        }

        int id = emit(frame.entity);
        if (id == 0) break;
        resolved_[frame.entity] = id;
        compiling_.erase(frame.entity);
        stack.pop_back();
    }

    if (!stack.empty()) {
        compiling_.clear();
        return 0;
    }
    return resolved_[entity];
}

int EntityCompiler::resolve_reference(const Entity* entity) {
    auto found = resolved_.find(entity);
    return found != resolved_.end() ? found->second : 0;
}

// render one entity whose references are all resolved, then intern it
int EntityCompiler::emit(const Entity* entity) {
    if (!is_normalized_name(entity->type_name)) {
        log_debug("entity_compiler: type name '%s' is not in normalized form", entity->type_name.c_str());
    }

    StrBuf* sb = strbuf_new();
    if (!sb) {
        fail(err_create(ERR_OUT_OF_MEMORY, NULL));
        return 0;
    }

    StepContext ctx(sb, this, mode_);
    if (format_step_attributes(ctx, entity->attrs) != ERR_OK) {
        P21Error* error = err_createf(ctx.error_code(), "cannot write entity %s", entity->type_name.c_str());
        err_set_cause(error, ctx.take_error());
        fail(error);
        strbuf_free(sb);
        return 0;
    }

    bool added = false;
    int id = table_.intern(entity->type_name, std::string(sb->str, sb->length), &added);
    if (!added) {
        log_debug("entity_compiler: %s reuses #%d", entity->type_name.c_str(), id);
    }
    strbuf_free(sb);
    return id;
}

} // namespace p21
