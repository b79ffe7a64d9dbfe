#pragma once

#include <ftl/lang/ast.hpp>
#include <vector>

namespace ftl {

// ---------------------------------------------------------------------------
// Visitor: read-only traversal, one hook per node kind
// ---------------------------------------------------------------------------
//
// Every default hook visits the node's children, so a subclass overrides
// only the kinds it cares about and calls the base hook to keep descending.
class Visitor {
public:
    virtual ~Visitor() = default;

    void visit(const Resource& resource);
    void visit(const Entry& entry);
    void visit(const Expression& expr);

    virtual void visit_message(const Message& msg);
    virtual void visit_term(const Term& term);
    virtual void visit_comment(const Comment&) {}
    virtual void visit_junk(const Junk&) {}
    virtual void visit_attribute(const Attribute& attr);
    virtual void visit_pattern(const Pattern& pattern);
    virtual void visit_text(const TextElement&) {}
    virtual void visit_placeable(const Placeable& placeable);
    virtual void visit_variant(const Variant& variant);
    virtual void visit_call_arguments(const CallArguments& args);

    virtual void visit_string_literal(const StringLiteral&) {}
    virtual void visit_number_literal(const NumberLiteral&) {}
    virtual void visit_variable_reference(const VariableReference&) {}
    virtual void visit_message_reference(const MessageReference&) {}
    virtual void visit_term_reference(const TermReference& ref);
    virtual void visit_function_reference(const FunctionReference& ref);
    virtual void visit_select_expression(const SelectExpression& select);
};

// ---------------------------------------------------------------------------
// Transformer: builds a new tree, never edits the input
// ---------------------------------------------------------------------------
//
// Entry and pattern-element hooks return a list: empty deletes the node, one
// element replaces it, several expand it in place. Expression hooks return
// the replacement expression. Defaults rebuild the node from transformed
// children. A rebuilt term or attribute whose value comes out empty keeps
// its original value, and a message left with neither value nor attributes
// is returned unchanged.
class Transformer {
public:
    virtual ~Transformer() = default;

    Resource transform(const Resource& resource);
    Pattern transform(const Pattern& pattern);

    virtual std::vector<Entry> transform_entry(const Entry& entry);
    virtual std::vector<PatternElement> transform_element(const PatternElement& element);
    virtual std::vector<Attribute> transform_attribute(const Attribute& attr);
    virtual ExprPtr transform_expression(const ExprPtr& expr);

protected:
    // Rebuild helpers for subclasses that override a hook but still want the
    // children transformed.
    Message rebuild(const Message& msg);
    Term rebuild(const Term& term);
    ExprPtr rebuild(const ExprPtr& expr);
};

} // namespace ftl
