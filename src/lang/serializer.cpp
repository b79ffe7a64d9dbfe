#include <ftl/lang/serializer.hpp>
#include <cstdio>

namespace ftl {

namespace {

void write_string_literal(std::string& out, const std::string& value) {
    out += '"';
    for (char ch : value) {
        switch (ch) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(ch));
                out += buf;
            } else {
                out += ch;
            }
        }
    }
    out += '"';
}

void write_number(std::string& out, const NumberLiteral& num) {
    if (!num.raw.empty()) {
        out += num.raw;
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", num.value);
    out += buf;
}

void write_expression(std::string& out, const Expression& expr);
void write_pattern(std::string& out, const Pattern& pattern);

void write_call_arguments(std::string& out, const CallArguments& args) {
    out += '(';
    bool first = true;
    for (const auto& arg : args.positional) {
        if (!first) out += ", ";
        first = false;
        if (arg) write_expression(out, *arg);
    }
    for (const auto& named : args.named) {
        if (!first) out += ", ";
        first = false;
        out += named.name;
        out += ": ";
        std::visit(overloaded{
            [&out](const StringLiteral& s) { write_string_literal(out, s.value); },
            [&out](const NumberLiteral& n) { write_number(out, n); },
        }, named.value);
    }
    out += ')';
}

void write_variant_key(std::string& out, const VariantKey& key) {
    std::visit(overloaded{
        [&out](const std::string& id) { out += id; },
        [&out](const NumberLiteral& n) { write_number(out, n); },
    }, key);
}

void write_expression(std::string& out, const Expression& expr) {
    std::visit(overloaded{
        [&out](const StringLiteral& n) { write_string_literal(out, n.value); },
        [&out](const NumberLiteral& n) { write_number(out, n); },
        [&out](const VariableReference& n) { out += '$'; out += n.id; },
        [&out](const MessageReference& n) {
            out += n.id;
            if (n.attribute) { out += '.'; out += *n.attribute; }
        },
        [&out](const TermReference& n) {
            out += '-';
            out += n.id;
            if (n.attribute) { out += '.'; out += *n.attribute; }
            if (n.arguments) write_call_arguments(out, *n.arguments);
        },
        [&out](const FunctionReference& n) {
            out += n.id;
            write_call_arguments(out, n.arguments);
        },
        [&out](const SelectExpression& n) {
            if (n.selector) write_expression(out, *n.selector);
            out += " ->";
            for (const auto& variant : n.variants) {
                out += variant.is_default ? "\n   *[" : "\n    [";
                write_variant_key(out, variant.key);
                out += ']';
                if (!variant.value.empty()) {
                    out += ' ';
                    write_pattern(out, variant.value);
                }
            }
            out += '\n';
        },
    }, expr.node);
}

void write_text(std::string& out, const std::string& text) {
    // Braces cannot appear as plain text; emit them as string placeables
    for (char ch : text) {
        if (ch == '{') {
            out += "{ \"{\" }";
        } else if (ch == '}') {
            out += "{ \"}\" }";
        } else {
            out += ch;
        }
    }
}

void write_pattern(std::string& out, const Pattern& pattern) {
    for (const auto& element : pattern.elements) {
        if (const auto* text = std::get_if<TextElement>(&element)) {
            write_text(out, text->value);
            continue;
        }
        const auto& placeable = std::get<Placeable>(element);
        if (!placeable.expression) continue;
        if (placeable.expression->is<SelectExpression>()) {
            out += "{ ";
            write_expression(out, *placeable.expression);
            out += '}';
        } else {
            out += "{ ";
            write_expression(out, *placeable.expression);
            out += " }";
        }
    }
}

void write_attributes(std::string& out, const std::vector<Attribute>& attrs) {
    for (const auto& attr : attrs) {
        out += "\n    .";
        out += attr.id;
        out += " = ";
        write_pattern(out, attr.value);
    }
}

void write_comment(std::string& out, const Comment& comment) {
    const char* prefix = comment_prefix(comment.kind);
    size_t begin = 0;
    while (true) {
        size_t end = comment.content.find('\n', begin);
        std::string line = comment.content.substr(
            begin, end == std::string::npos ? std::string::npos : end - begin);
        out += prefix;
        if (!line.empty()) {
            out += ' ';
            out += line;
        }
        out += '\n';
        if (end == std::string::npos) break;
        begin = end + 1;
    }
}

void write_entry(std::string& out, const Entry& entry) {
    std::visit(overloaded{
        [&out](const Message& m) {
            out += m.id;
            out += " =";
            if (m.value) {
                out += ' ';
                write_pattern(out, *m.value);
            }
            write_attributes(out, m.attributes);
            out += '\n';
        },
        [&out](const Term& t) {
            out += '-';
            out += t.id;
            out += " = ";
            write_pattern(out, t.value);
            write_attributes(out, t.attributes);
            out += '\n';
        },
        [&out](const Comment& c) { write_comment(out, c); },
        [&out](const Junk& j) { out += j.content; },
    }, entry);
}

} // namespace

std::string serialize(const Resource& resource) {
    std::string out;
    bool after_junk = true;
    for (const auto& entry : resource.entries) {
        // Junk already ends with its own line breaks and would swallow a
        // separator line on the next parse
        if (!out.empty() && !after_junk) out += '\n';
        write_entry(out, entry);
        after_junk = std::holds_alternative<Junk>(entry);
    }
    return out;
}

std::string serialize(const Pattern& pattern) {
    std::string out;
    write_pattern(out, pattern);
    return out;
}

std::string serialize(const Expression& expr) {
    std::string out;
    write_expression(out, expr);
    return out;
}

} // namespace ftl
