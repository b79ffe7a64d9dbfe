#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ftl {

// Visitor helper for std::visit over the closed node unions below. A missing
// alternative is a compile error.
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Half-open byte range into the parsed source
struct Span {
    size_t start = 0;
    size_t end = 0;

    bool operator==(const Span& o) const { return start == o.start && end == o.end; }
    bool operator!=(const Span& o) const { return !(*this == o); }
};

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

struct Expression;
using ExprPtr = std::shared_ptr<const Expression>;

struct StringLiteral {
    std::string value;      // unescaped
};

struct NumberLiteral {
    std::string raw;        // source text, e.g. "-01.50"
    double value = 0.0;

    bool is_integer() const { return raw.find('.') == std::string::npos; }
};

// Named-argument values may only be literals
using Literal = std::variant<StringLiteral, NumberLiteral>;

struct NamedArgument {
    std::string name;
    Literal value;
};

struct CallArguments {
    std::vector<ExprPtr> positional;
    std::vector<NamedArgument> named;

    bool empty() const { return positional.empty() && named.empty(); }
};

struct VariableReference {
    std::string id;
};

struct MessageReference {
    std::string id;
    std::optional<std::string> attribute;
};

struct TermReference {
    std::string id;                            // without the leading '-'
    std::optional<std::string> attribute;
    std::optional<CallArguments> arguments;
};

struct FunctionReference {
    std::string id;
    CallArguments arguments;
};

// ---------------------------------------------------------------------------
// Patterns
// ---------------------------------------------------------------------------

struct TextElement {
    std::string value;
};

struct Placeable {
    ExprPtr expression;
};

using PatternElement = std::variant<TextElement, Placeable>;

struct Pattern {
    std::vector<PatternElement> elements;

    bool empty() const { return elements.empty(); }
};

using VariantKey = std::variant<std::string, NumberLiteral>;

struct Variant {
    VariantKey key;
    Pattern value;
    bool is_default = false;
    Span span;
};

struct SelectExpression {
    ExprPtr selector;
    std::vector<Variant> variants;
};

struct Expression {
    using Node = std::variant<StringLiteral,
                              NumberLiteral,
                              VariableReference,
                              MessageReference,
                              TermReference,
                              FunctionReference,
                              SelectExpression>;
    Node node;
    Span span;

    template<typename T>
    const T* get_if() const { return std::get_if<T>(&node); }
    template<typename T>
    bool is() const { return std::holds_alternative<T>(node); }
};

template<typename T>
ExprPtr make_expr(T node, Span span = {}) {
    return std::make_shared<const Expression>(Expression{std::move(node), span});
}

// ---------------------------------------------------------------------------
// Entries
// ---------------------------------------------------------------------------

struct Attribute {
    std::string id;
    Pattern value;
    Span span;
};

struct Message {
    std::string id;
    std::optional<Pattern> value;
    std::vector<Attribute> attributes;
    Span span;

    const Attribute* attribute(const std::string& name) const;
};

struct Term {
    std::string id;                 // without the leading '-'
    Pattern value;
    std::vector<Attribute> attributes;
    Span span;

    const Attribute* attribute(const std::string& name) const;
};

enum class CommentKind {
    Line,       // #
    Group,      // ##
    Resource    // ###
};

struct Comment {
    std::string content;
    CommentKind kind = CommentKind::Line;
    Span span;
};

struct Annotation {
    std::string code;
    std::string message;
    Span span;
};

struct Junk {
    std::string content;
    std::vector<Annotation> annotations;
    Span span;
};

using Entry = std::variant<Message, Term, Comment, Junk>;

struct Resource {
    std::vector<Entry> entries;

    template<typename T>
    size_t count() const {
        size_t n = 0;
        for (const auto& e : entries) {
            if (std::holds_alternative<T>(e)) ++n;
        }
        return n;
    }
};

const char* comment_prefix(CommentKind kind);

} // namespace ftl
