#pragma once

#include <ftl/diagnostic.hpp>
#include <ftl/result.hpp>
#include <ftl/value.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ftl {

using NamedArgs = std::map<std::string, FluentValue>;

// A callable exposed to messages as NAME(...). Returning an error (or
// throwing std::exception) turns into a FUNCTION_FAILED diagnostic.
using FluentFunction = std::function<Result<FluentValue>(
    const std::vector<FluentValue>& positional, const NamedArgs& named)>;

// ---------------------------------------------------------------------------
// FunctionRegistry
// ---------------------------------------------------------------------------

class FunctionRegistry {
public:
    FunctionRegistry() = default;

    // Registry preloaded with NUMBER, DATETIME and CURRENCY
    static FunctionRegistry with_builtins();

    // Add or replace a function. Names must be upper-case identifiers
    // (A-Z, 0-9, '_' and '-', starting with a letter).
    Status add(const std::string& name, FluentFunction fn);

    bool has_function(const std::string& name) const;

    Result<FluentValue, Diagnostic> call(const std::string& name,
                                         const std::vector<FluentValue>& positional,
                                         const NamedArgs& named) const;

    // True when `name` still maps to this registry's own built-in entry.
    // A user function registered under a built-in name is not a built-in.
    bool is_builtin(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return functions_.size(); }

private:
    using Entry = std::shared_ptr<const FluentFunction>;

    std::map<std::string, Entry> functions_;
    std::map<std::string, Entry> builtins_;
};

// ---------------------------------------------------------------------------
// Built-in formatting functions
//
// Each takes the value as its first positional argument and the locale
// code as its last one. The resolver appends the locale automatically.
// ---------------------------------------------------------------------------

namespace builtins {

// NUMBER(value, minimumFractionDigits: 0, maximumFractionDigits: 3,
//        useGrouping: "true")
Result<FluentValue> number(const std::vector<FluentValue>& positional, const NamedArgs& named);

// DATETIME(value, dateStyle: "medium", timeStyle: "none"), formatted in UTC
Result<FluentValue> datetime(const std::vector<FluentValue>& positional, const NamedArgs& named);

// CURRENCY(value, currency: "EUR", currencyDisplay: "symbol"|"code"|"name")
Result<FluentValue> currency(const std::vector<FluentValue>& positional, const NamedArgs& named);

} // namespace builtins

} // namespace ftl
