#pragma once

#include <ftl/diagnostic.hpp>
#include <ftl/functions.hpp>
#include <ftl/lang/ast.hpp>
#include <ftl/plural.hpp>
#include <ftl/value.hpp>

#include <optional>
#include <string>
#include <unordered_map>

namespace ftl {

using MessageTable = std::unordered_map<std::string, Message>;
using TermTable = std::unordered_map<std::string, Term>;

struct ResolverOptions {
    std::string locale = "en-US";
    bool use_isolating = true;      // wrap placeables in U+2068 .. U+2069
    PluralFunction plural = plural_category;
};

struct ResolveResult {
    std::string value;
    Diagnostics errors;

    bool ok() const { return errors.empty(); }
};

// Turns message patterns into strings. Never throws for bad data: every
// reference, resolution or function failure is reported as a Diagnostic and
// replaced by a readable fallback such as {$name} or {-brand}.
//
// The tables and registry are borrowed and must outlive the resolver.
// All per-call state lives on the stack of resolve(), so one resolver may
// be shared by concurrent callers as long as the tables are not mutated.
class Resolver {
public:
    Resolver(const MessageTable& messages, const TermTable& terms,
             const FunctionRegistry& functions, ResolverOptions options = {});

    ResolveResult resolve(const Message& message, const FluentArgs& args = {},
                          const std::optional<std::string>& attribute = std::nullopt) const;

    // Resolve a free-standing pattern, e.g. one built by a transformer
    ResolveResult resolve_pattern(const Pattern& pattern, const FluentArgs& args = {}) const;

    const ResolverOptions& options() const { return options_; }

private:
    struct Scope;

    std::string resolve_pattern(Scope& scope, const Pattern& pattern) const;
    std::optional<FluentValue> eval(Scope& scope, const Expression& expr) const;
    std::optional<FluentValue> eval_message_ref(Scope& scope, const Expression& expr,
                                                const MessageReference& ref) const;
    std::optional<FluentValue> eval_term_ref(Scope& scope, const Expression& expr,
                                             const TermReference& ref) const;
    std::optional<FluentValue> eval_function(Scope& scope, const Expression& expr,
                                             const FunctionReference& ref) const;
    std::optional<FluentValue> eval_select(Scope& scope, const Expression& expr,
                                           const SelectExpression& select) const;

    const MessageTable& messages_;
    const TermTable& terms_;
    const FunctionRegistry& functions_;
    ResolverOptions options_;
};

// Readable stand-in for a placeable that failed to resolve
std::string fallback_for(const Expression& expr);

} // namespace ftl
