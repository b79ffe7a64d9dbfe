#include <ftl/lang/visitor.hpp>

namespace ftl {

// ---------------------------------------------------------------------------
// Visitor
// ---------------------------------------------------------------------------

void Visitor::visit(const Resource& resource) {
    for (const auto& entry : resource.entries) {
        visit(entry);
    }
}

void Visitor::visit(const Entry& entry) {
    std::visit(overloaded{
        [this](const Message& m) { visit_message(m); },
        [this](const Term& t) { visit_term(t); },
        [this](const Comment& c) { visit_comment(c); },
        [this](const Junk& j) { visit_junk(j); },
    }, entry);
}

void Visitor::visit(const Expression& expr) {
    std::visit(overloaded{
        [this](const StringLiteral& n) { visit_string_literal(n); },
        [this](const NumberLiteral& n) { visit_number_literal(n); },
        [this](const VariableReference& n) { visit_variable_reference(n); },
        [this](const MessageReference& n) { visit_message_reference(n); },
        [this](const TermReference& n) { visit_term_reference(n); },
        [this](const FunctionReference& n) { visit_function_reference(n); },
        [this](const SelectExpression& n) { visit_select_expression(n); },
    }, expr.node);
}

void Visitor::visit_message(const Message& msg) {
    if (msg.value) visit_pattern(*msg.value);
    for (const auto& attr : msg.attributes) visit_attribute(attr);
}

void Visitor::visit_term(const Term& term) {
    visit_pattern(term.value);
    for (const auto& attr : term.attributes) visit_attribute(attr);
}

void Visitor::visit_attribute(const Attribute& attr) {
    visit_pattern(attr.value);
}

void Visitor::visit_pattern(const Pattern& pattern) {
    for (const auto& element : pattern.elements) {
        if (const auto* text = std::get_if<TextElement>(&element)) {
            visit_text(*text);
        } else {
            visit_placeable(std::get<Placeable>(element));
        }
    }
}

void Visitor::visit_placeable(const Placeable& placeable) {
    if (placeable.expression) visit(*placeable.expression);
}

void Visitor::visit_variant(const Variant& variant) {
    visit_pattern(variant.value);
}

void Visitor::visit_call_arguments(const CallArguments& args) {
    for (const auto& arg : args.positional) {
        if (arg) visit(*arg);
    }
    for (const auto& named : args.named) {
        std::visit(overloaded{
            [this](const StringLiteral& s) { visit_string_literal(s); },
            [this](const NumberLiteral& n) { visit_number_literal(n); },
        }, named.value);
    }
}

void Visitor::visit_term_reference(const TermReference& ref) {
    if (ref.arguments) visit_call_arguments(*ref.arguments);
}

void Visitor::visit_function_reference(const FunctionReference& ref) {
    visit_call_arguments(ref.arguments);
}

void Visitor::visit_select_expression(const SelectExpression& select) {
    if (select.selector) visit(*select.selector);
    for (const auto& variant : select.variants) visit_variant(variant);
}

// ---------------------------------------------------------------------------
// Transformer
// ---------------------------------------------------------------------------

Resource Transformer::transform(const Resource& resource) {
    Resource out;
    for (const auto& entry : resource.entries) {
        for (auto& e : transform_entry(entry)) {
            out.entries.push_back(std::move(e));
        }
    }
    return out;
}

Pattern Transformer::transform(const Pattern& pattern) {
    Pattern out;
    for (const auto& element : pattern.elements) {
        for (auto& e : transform_element(element)) {
            out.elements.push_back(std::move(e));
        }
    }
    return out;
}

std::vector<Entry> Transformer::transform_entry(const Entry& entry) {
    return std::visit(overloaded{
        [this](const Message& m) { return std::vector<Entry>{rebuild(m)}; },
        [this](const Term& t) { return std::vector<Entry>{rebuild(t)}; },
        [](const Comment& c) { return std::vector<Entry>{c}; },
        [](const Junk& j) { return std::vector<Entry>{j}; },
    }, entry);
}

std::vector<PatternElement> Transformer::transform_element(const PatternElement& element) {
    if (const auto* placeable = std::get_if<Placeable>(&element)) {
        ExprPtr expr = transform_expression(placeable->expression);
        if (!expr) return {};
        return {Placeable{std::move(expr)}};
    }
    return {element};
}

// An attribute whose elements were all deleted keeps its original value
std::vector<Attribute> Transformer::transform_attribute(const Attribute& attr) {
    Pattern value = transform(attr.value);
    if (value.empty()) return {attr};
    return {Attribute{attr.id, std::move(value), attr.span}};
}

ExprPtr Transformer::transform_expression(const ExprPtr& expr) {
    return rebuild(expr);
}

Message Transformer::rebuild(const Message& msg) {
    Message out;
    out.id = msg.id;
    out.span = msg.span;
    if (msg.value) {
        Pattern value = transform(*msg.value);
        if (!value.empty()) out.value = std::move(value);
    }
    for (const auto& attr : msg.attributes) {
        for (auto& a : transform_attribute(attr)) {
            out.attributes.push_back(std::move(a));
        }
    }
    // A message left with neither a value nor an attribute stays as it was
    if (!out.value && out.attributes.empty()) return msg;
    return out;
}

Term Transformer::rebuild(const Term& term) {
    Term out;
    out.id = term.id;
    out.span = term.span;
    out.value = transform(term.value);
    // Terms always have a value
    if (out.value.empty()) out.value = term.value;
    for (const auto& attr : term.attributes) {
        for (auto& a : transform_attribute(attr)) {
            out.attributes.push_back(std::move(a));
        }
    }
    return out;
}

ExprPtr Transformer::rebuild(const ExprPtr& expr) {
    if (!expr) return expr;

    auto rebuild_args = [this](const CallArguments& args) {
        CallArguments out;
        out.named = args.named;
        for (const auto& arg : args.positional) {
            if (ExprPtr e = transform_expression(arg)) out.positional.push_back(std::move(e));
        }
        return out;
    };

    if (const auto* fn = expr->get_if<FunctionReference>()) {
        FunctionReference copy{fn->id, rebuild_args(fn->arguments)};
        return make_expr(std::move(copy), expr->span);
    }
    if (const auto* term = expr->get_if<TermReference>()) {
        if (!term->arguments) return expr;
        TermReference copy{term->id, term->attribute, rebuild_args(*term->arguments)};
        return make_expr(std::move(copy), expr->span);
    }
    if (const auto* select = expr->get_if<SelectExpression>()) {
        SelectExpression copy;
        copy.selector = transform_expression(select->selector);
        if (!copy.selector) copy.selector = select->selector;
        for (const auto& variant : select->variants) {
            copy.variants.push_back(Variant{variant.key, transform(variant.value),
                                            variant.is_default, variant.span});
        }
        return make_expr(std::move(copy), expr->span);
    }
    // Leaves have no children; share the immutable node
    return expr;
}

} // namespace ftl
