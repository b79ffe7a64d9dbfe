#include <ftl/resolver.hpp>
#include <ftl/log.hpp>

#include <algorithm>
#include <charconv>
#include <system_error>

namespace ftl {

namespace {

const char* kFsi = "\xE2\x81\xA8";    // U+2068 FIRST STRONG ISOLATE
const char* kPdi = "\xE2\x81\xA9";    // U+2069 POP DIRECTIONAL ISOLATE

// Integers stay exact, falling back to their digits once they overflow
// int64_t. Decimals keep a fraction in their display form ("1.0").
FluentValue literal_value(const NumberLiteral& num) {
    const std::string& raw = num.raw;
    if (num.is_integer()) {
        int64_t i = 0;
        auto res = std::from_chars(raw.data(), raw.data() + raw.size(), i);
        if (res.ec == std::errc() && res.ptr == raw.data() + raw.size()) {
            return FluentValue(i);
        }
        bool negative = !raw.empty() && raw[0] == '-';
        size_t first = raw.find_first_not_of('0', negative ? 1 : 0);
        std::string digits = first == std::string::npos ? "0" : raw.substr(first);
        return FluentValue(FluentNumber{num.value, (negative ? "-" : "") + digits});
    }

    std::string shown = FluentValue(num.value).to_string();
    if (shown.find_first_of(".eEnN") == std::string::npos) shown += ".0";
    return FluentValue(FluentNumber{num.value, std::move(shown)});
}

FluentValue literal_value(const Literal& lit) {
    return std::visit(overloaded{
        [](const StringLiteral& s) { return FluentValue(s.value); },
        [](const NumberLiteral& n) { return literal_value(n); },
    }, lit);
}

std::string reference_key(const std::string& id, const std::optional<std::string>& attribute) {
    return attribute ? id + "." + *attribute : id;
}

Diagnostic at(Diagnostic d, const Expression& expr) {
    d.span = expr.span;
    return d;
}

} // namespace

// Per-call state: the chain of message/term keys being resolved and the
// diagnostics collected so far.
struct Resolver::Scope {
    const FluentArgs* args = nullptr;
    std::vector<std::string> stack;
    Diagnostics errors;

    bool on_stack(const std::string& key) const {
        return std::find(stack.begin(), stack.end(), key) != stack.end();
    }
};

namespace {

// Pushes a key for the lifetime of one nested resolution
class StackFrame {
public:
    StackFrame(std::vector<std::string>& stack, std::string key) : stack_(stack) {
        stack_.push_back(std::move(key));
    }
    ~StackFrame() { stack_.pop_back(); }

    StackFrame(const StackFrame&) = delete;
    StackFrame& operator=(const StackFrame&) = delete;

private:
    std::vector<std::string>& stack_;
};

} // namespace

std::string fallback_for(const Expression& expr) {
    return std::visit(overloaded{
        [](const VariableReference& n) { return "{$" + n.id + "}"; },
        [](const MessageReference& n) { return "{" + reference_key(n.id, n.attribute) + "}"; },
        [](const TermReference& n) { return "{-" + reference_key(n.id, n.attribute) + "}"; },
        [](const FunctionReference& n) { return "{" + n.id + "(...)}"; },
        [](const auto&) { return std::string("{???}"); },
    }, expr.node);
}

// ---------------------------------------------------------------------------
// Resolver
// ---------------------------------------------------------------------------

Resolver::Resolver(const MessageTable& messages, const TermTable& terms,
                   const FunctionRegistry& functions, ResolverOptions options)
    : messages_(messages), terms_(terms), functions_(functions),
      options_(std::move(options)) {
    if (!options_.plural) options_.plural = plural_category;
}

ResolveResult Resolver::resolve(const Message& message, const FluentArgs& args,
                                const std::optional<std::string>& attribute) const {
    Scope scope;
    scope.args = &args;

    const Pattern* pattern = nullptr;
    if (attribute) {
        const Attribute* attr = message.attribute(*attribute);
        if (!attr) {
            scope.errors.push_back(diag::attribute_not_found(*attribute, message.id));
            return {"{" + message.id + "." + *attribute + "}", std::move(scope.errors)};
        }
        pattern = &attr->value;
    } else {
        if (!message.value) {
            scope.errors.push_back(diag::message_no_value(message.id));
            return {"{" + message.id + "}", std::move(scope.errors)};
        }
        pattern = &*message.value;
    }

    StackFrame frame(scope.stack, reference_key(message.id, attribute));
    std::string value = resolve_pattern(scope, *pattern);
    return {std::move(value), std::move(scope.errors)};
}

ResolveResult Resolver::resolve_pattern(const Pattern& pattern, const FluentArgs& args) const {
    Scope scope;
    scope.args = &args;
    std::string value = resolve_pattern(scope, pattern);
    return {std::move(value), std::move(scope.errors)};
}

std::string Resolver::resolve_pattern(Scope& scope, const Pattern& pattern) const {
    std::string out;
    for (const auto& element : pattern.elements) {
        if (const auto* text = std::get_if<TextElement>(&element)) {
            out += text->value;
            continue;
        }

        const auto& placeable = std::get<Placeable>(element);
        if (!placeable.expression) {
            out += "{???}";
            continue;
        }

        auto value = eval(scope, *placeable.expression);
        if (!value) {
            out += fallback_for(*placeable.expression);
            continue;
        }
        if (options_.use_isolating) {
            out += kFsi;
            out += value->to_string();
            out += kPdi;
        } else {
            out += value->to_string();
        }
    }
    return out;
}

std::optional<FluentValue> Resolver::eval(Scope& scope, const Expression& expr) const {
    return std::visit(overloaded{
        [](const StringLiteral& n) -> std::optional<FluentValue> {
            return FluentValue(n.value);
        },
        [](const NumberLiteral& n) -> std::optional<FluentValue> {
            return literal_value(n);
        },
        [&](const VariableReference& n) -> std::optional<FluentValue> {
            auto it = scope.args->find(n.id);
            if (it == scope.args->end()) {
                scope.errors.push_back(at(diag::variable_not_provided(n.id), expr));
                return std::nullopt;
            }
            return it->second;
        },
        [&](const MessageReference& n) { return eval_message_ref(scope, expr, n); },
        [&](const TermReference& n) { return eval_term_ref(scope, expr, n); },
        [&](const FunctionReference& n) { return eval_function(scope, expr, n); },
        [&](const SelectExpression& n) { return eval_select(scope, expr, n); },
    }, expr.node);
}

std::optional<FluentValue> Resolver::eval_message_ref(Scope& scope, const Expression& expr,
                                                      const MessageReference& ref) const {
    auto it = messages_.find(ref.id);
    if (it == messages_.end()) {
        scope.errors.push_back(at(diag::message_not_found(ref.id), expr));
        return std::nullopt;
    }
    const Message& message = it->second;

    const Pattern* pattern = nullptr;
    if (ref.attribute) {
        const Attribute* attr = message.attribute(*ref.attribute);
        if (!attr) {
            scope.errors.push_back(at(diag::attribute_not_found(*ref.attribute, ref.id), expr));
            return std::nullopt;
        }
        pattern = &attr->value;
    } else if (message.value) {
        pattern = &*message.value;
    } else {
        scope.errors.push_back(at(diag::message_no_value(ref.id), expr));
        return std::nullopt;
    }

    std::string key = reference_key(ref.id, ref.attribute);
    if (scope.on_stack(key)) {
        auto path = scope.stack;
        path.push_back(key);
        log::trace("cyclic reference at '%s'", key.c_str());
        scope.errors.push_back(at(diag::cyclic_reference(path), expr));
        return std::nullopt;
    }

    StackFrame frame(scope.stack, std::move(key));
    return FluentValue(resolve_pattern(scope, *pattern));
}

std::optional<FluentValue> Resolver::eval_term_ref(Scope& scope, const Expression& expr,
                                                   const TermReference& ref) const {
    auto it = terms_.find(ref.id);
    if (it == terms_.end()) {
        scope.errors.push_back(at(diag::term_not_found(ref.id), expr));
        return std::nullopt;
    }
    const Term& term = it->second;

    const Pattern* pattern = &term.value;
    if (ref.attribute) {
        const Attribute* attr = term.attribute(*ref.attribute);
        if (!attr) {
            scope.errors.push_back(at(diag::term_attribute_not_found(*ref.attribute, ref.id), expr));
            return std::nullopt;
        }
        pattern = &attr->value;
    }

    std::string key = "-" + reference_key(ref.id, ref.attribute);
    if (scope.on_stack(key)) {
        auto path = scope.stack;
        path.push_back(key);
        log::trace("cyclic reference at '%s'", key.c_str());
        scope.errors.push_back(at(diag::cyclic_reference(path), expr));
        return std::nullopt;
    }

    // Terms see the caller's variables, overridden by their own call's
    // named arguments
    FluentArgs term_args = scope.args ? *scope.args : FluentArgs{};
    if (ref.arguments) {
        for (const auto& named : ref.arguments->named) {
            term_args[named.name] = literal_value(named.value);
        }
    }

    const FluentArgs* outer = scope.args;
    scope.args = &term_args;
    std::string value;
    {
        StackFrame frame(scope.stack, std::move(key));
        value = resolve_pattern(scope, *pattern);
    }
    scope.args = outer;
    return FluentValue(std::move(value));
}

std::optional<FluentValue> Resolver::eval_function(Scope& scope, const Expression& expr,
                                                   const FunctionReference& ref) const {
    std::vector<FluentValue> positional;
    positional.reserve(ref.arguments.positional.size() + 1);
    for (const auto& arg : ref.arguments.positional) {
        if (!arg) return std::nullopt;
        auto value = eval(scope, *arg);
        if (!value) return std::nullopt;
        positional.push_back(std::move(*value));
    }

    NamedArgs named;
    for (const auto& arg : ref.arguments.named) {
        named[arg.name] = literal_value(arg.value);
    }

    if (functions_.is_builtin(ref.id)) {
        positional.emplace_back(options_.locale);
    }

    auto result = functions_.call(ref.id, positional, named);
    if (result.is_err()) {
        scope.errors.push_back(at(std::move(result).error(), expr));
        return std::nullopt;
    }
    return std::move(result).value();
}

std::optional<FluentValue> Resolver::eval_select(Scope& scope, const Expression& expr,
                                                 const SelectExpression& select) const {
    if (select.variants.empty()) {
        scope.errors.push_back(at(diag::no_variants(), expr));
        return std::nullopt;
    }

    // A failed selector has already been reported; fall through to the
    // default variant.
    std::optional<FluentValue> selector;
    if (select.selector) selector = eval(scope, *select.selector);

    const Variant* chosen = nullptr;
    if (selector) {
        std::string text = selector->to_string();
        std::optional<double> number = selector->as_number();

        for (const auto& variant : select.variants) {
            bool match = std::visit(overloaded{
                [&](const std::string& key) { return key == text; },
                [&](const NumberLiteral& key) { return number && *number == key.value; },
            }, variant.key);
            if (match) {
                chosen = &variant;
                break;
            }
        }

        if (!chosen && number) {
            std::string category = options_.plural(*number, options_.locale);
            for (const auto& variant : select.variants) {
                const auto* key = std::get_if<std::string>(&variant.key);
                if (key && *key == category) {
                    chosen = &variant;
                    break;
                }
            }
        }
    }

    if (!chosen) {
        for (const auto& variant : select.variants) {
            if (variant.is_default) {
                chosen = &variant;
                break;
            }
        }
    }
    if (!chosen) chosen = &select.variants.front();

    return FluentValue(resolve_pattern(scope, chosen->value));
}

} // namespace ftl
