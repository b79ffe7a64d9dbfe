#pragma once

#include <ftl/lang/ast.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ftl {

// Where a variable appears
enum class VariableContext {
    Pattern,        // directly in a placeable
    Selector,       // as (part of) a select expression selector
    Variant,        // inside a variant's pattern
    FunctionArg     // as a positional function argument
};

const char* context_name(VariableContext ctx);

struct VariableInfo {
    std::string name;
    VariableContext context = VariableContext::Pattern;

    bool operator==(const VariableInfo& o) const {
        return name == o.name && context == o.context;
    }
};

struct FunctionCallInfo {
    std::string name;
    std::vector<std::string> positional_variables;  // $vars passed positionally
    std::vector<std::string> named_keys;            // option names, sorted
};

enum class ReferenceKind { Message, Term };

struct ReferenceInfo {
    std::string id;
    ReferenceKind kind = ReferenceKind::Message;
    std::optional<std::string> attribute;

    bool operator==(const ReferenceInfo& o) const {
        return id == o.id && kind == o.kind && attribute == o.attribute;
    }
};

// Static description of what a message needs at format time. Variables and
// references are de-duplicated and kept in order of first appearance;
// functions has one entry per call site.
struct MessageInfo {
    std::string id;
    std::vector<VariableInfo> variables;
    std::vector<FunctionCallInfo> functions;
    std::vector<ReferenceInfo> references;
    bool has_selectors = false;

    std::set<std::string> variable_names() const;
    bool requires_variable(const std::string& name) const;
    std::set<std::string> function_names() const;
};

// Walks the value and every attribute
MessageInfo introspect(const Message& message);
MessageInfo introspect(const Term& term);

} // namespace ftl
