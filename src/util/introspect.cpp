#include <ftl/introspect.hpp>
#include <ftl/lang/visitor.hpp>

#include <algorithm>

namespace ftl {

const char* context_name(VariableContext ctx) {
    switch (ctx) {
    case VariableContext::Pattern:     return "pattern";
    case VariableContext::Selector:    return "selector";
    case VariableContext::Variant:     return "variant";
    case VariableContext::FunctionArg: return "function-arg";
    }
    return "unknown";
}

namespace {

template<typename T>
void add_unique(std::vector<T>& list, T item) {
    if (std::find(list.begin(), list.end(), item) == list.end()) {
        list.push_back(std::move(item));
    }
}

class IntrospectionVisitor : public Visitor {
public:
    explicit IntrospectionVisitor(MessageInfo& info) : info_(info) {}

    void visit_variable_reference(const VariableReference& ref) override {
        add_unique(info_.variables, VariableInfo{ref.id, context_});
    }

    void visit_message_reference(const MessageReference& ref) override {
        add_unique(info_.references, ReferenceInfo{ref.id, ReferenceKind::Message, ref.attribute});
    }

    void visit_term_reference(const TermReference& ref) override {
        add_unique(info_.references, ReferenceInfo{ref.id, ReferenceKind::Term, ref.attribute});
        Visitor::visit_term_reference(ref);
    }

    void visit_function_reference(const FunctionReference& ref) override {
        FunctionCallInfo call;
        call.name = ref.id;
        for (const auto& arg : ref.arguments.positional) {
            if (!arg) continue;
            if (const auto* var = arg->get_if<VariableReference>()) {
                call.positional_variables.push_back(var->id);
            }
        }
        for (const auto& named : ref.arguments.named) {
            call.named_keys.push_back(named.name);
        }
        std::sort(call.named_keys.begin(), call.named_keys.end());
        info_.functions.push_back(std::move(call));

        VariableContext saved = context_;
        context_ = VariableContext::FunctionArg;
        Visitor::visit_function_reference(ref);
        context_ = saved;
    }

    void visit_select_expression(const SelectExpression& select) override {
        info_.has_selectors = true;
        VariableContext saved = context_;
        context_ = VariableContext::Selector;
        if (select.selector) visit(*select.selector);
        context_ = VariableContext::Variant;
        for (const auto& variant : select.variants) visit_variant(variant);
        context_ = saved;
    }

private:
    MessageInfo& info_;
    VariableContext context_ = VariableContext::Pattern;
};

} // namespace

std::set<std::string> MessageInfo::variable_names() const {
    std::set<std::string> out;
    for (const auto& v : variables) out.insert(v.name);
    return out;
}

bool MessageInfo::requires_variable(const std::string& name) const {
    for (const auto& v : variables) {
        if (v.name == name) return true;
    }
    return false;
}

std::set<std::string> MessageInfo::function_names() const {
    std::set<std::string> out;
    for (const auto& f : functions) out.insert(f.name);
    return out;
}

MessageInfo introspect(const Message& message) {
    MessageInfo info;
    info.id = message.id;
    IntrospectionVisitor visitor(info);
    visitor.visit_message(message);
    return info;
}

MessageInfo introspect(const Term& term) {
    MessageInfo info;
    info.id = term.id;
    IntrospectionVisitor visitor(info);
    visitor.visit_term(term);
    return info;
}

} // namespace ftl
