#include <ftl/lang/parser.hpp>
#include <algorithm>
#include <charconv>
#include <cstdint>

namespace ftl {

namespace {

// Deepest accepted nesting of placeables and call argument lists; bounds
// recursion on adversarial input.
constexpr int kMaxNesting = 64;

enum class PatternMode {
    Entry,      // message, term or attribute value
    Variant     // select-expression variant value
};

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

template<typename T>
ParseResult<T> success(T value, Cursor cursor) {
    return ParseResult<T>::ok(Parsed<T>{std::move(value), cursor});
}

bool is_ascii_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_ident_char(char c) {
    return is_ascii_letter(c) || is_digit(c) || c == '-' || c == '_';
}

bool is_line_end(char c) {
    return c == '\n' || c == '\r';
}

bool is_hex(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_uppercase_identifier(const std::string& id) {
    return std::none_of(id.begin(), id.end(),
                        [](char c) { return c >= 'a' && c <= 'z'; });
}

bool next_is_letter(const Cursor& c, size_t offset) {
    auto ch = c.peek(offset);
    return ch && is_ascii_letter(*ch);
}

Cursor skip_blank_inline(Cursor c) {
    while (c.at(' ')) c = c.advance();
    return c;
}

// Spaces and line terminators; tabs are not blank in FTL
Cursor skip_blank(Cursor c) {
    while (c.at(' ') || c.at('\n') || c.at('\r')) c = c.advance();
    return c;
}

Cursor skip_line_end(Cursor c) {
    if (c.at('\r')) c = c.advance();
    if (c.at('\n')) c = c.advance();
    return c;
}

Cursor skip_to_line_end(Cursor c) {
    while (!c.is_eof() && !is_line_end(c.current())) c = c.advance();
    return c;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// The next line continues the current pattern: it is indented and does not
// start a variant, default variant or attribute.
bool is_indented_continuation(const Cursor& c, PatternMode mode) {
    if (c.is_eof() || !is_line_end(c.current())) return false;

    Cursor next = skip_line_end(c);
    if (!next.at(' ')) return false;
    next = skip_blank_inline(next);
    if (next.is_eof()) return true;

    char ch = next.current();
    if (ch == '[' || ch == '*' || ch == '.') return false;
    if (mode == PatternMode::Variant && ch == '}') return false;
    return true;
}

// Inline blank after '=' or ']', then any indented lines that only lead up to
// the first line holding pattern text.
Cursor skip_pattern_start(Cursor c, PatternMode mode) {
    c = skip_blank_inline(c);
    while (!c.is_eof() && is_line_end(c.current()) && is_indented_continuation(c, mode)) {
        c = skip_blank_inline(skip_line_end(c));
    }
    return c;
}

// ---------------------------------------------------------------------------
// Primitives
// ---------------------------------------------------------------------------

ParseResult<std::string> parse_identifier(Cursor c) {
    if (c.is_eof() || !is_ascii_letter(c.current())) {
        return ParseError("Expected identifier", c, {"a-z", "A-Z"});
    }
    Cursor start = c;
    c = c.advance();
    while (!c.is_eof() && is_ident_char(c.current())) c = c.advance();
    return success(start.slice_to(c.pos()), c);
}

ParseResult<NumberLiteral> parse_number(Cursor c) {
    Cursor start = c;
    if (c.at('-')) c = c.advance();
    if (c.is_eof() || !is_digit(c.current())) {
        return ParseError("Expected digit", c, {"0-9"});
    }
    while (!c.is_eof() && is_digit(c.current())) c = c.advance();

    if (c.at('.')) {
        Cursor frac = c.advance();
        if (frac.is_eof() || !is_digit(frac.current())) {
            return ParseError("Expected digit after decimal point", frac, {"0-9"});
        }
        c = frac;
        while (!c.is_eof() && is_digit(c.current())) c = c.advance();
    }

    NumberLiteral num;
    num.raw = start.slice_to(c.pos());
    std::from_chars(num.raw.data(), num.raw.data() + num.raw.size(), num.value);
    return success(std::move(num), c);
}

// Cursor is at the backslash. Yields the UTF-8 encoding of the escaped char.
ParseResult<std::string> parse_escape_sequence(Cursor c) {
    Cursor backslash = c;
    c = c.advance();
    if (c.is_eof()) {
        return ParseError("Unterminated string literal", backslash, {"\""});
    }

    char ch = c.current();
    switch (ch) {
    case '"':  return success(std::string("\""), c.advance());
    case '\\': return success(std::string("\\"), c.advance());
    case 'n':  return success(std::string("\n"), c.advance());
    case 't':  return success(std::string("\t"), c.advance());
    case 'u':
    case 'U': {
        size_t digits = (ch == 'u') ? 4 : 6;
        Cursor hex = c.advance();
        uint32_t cp = 0;
        for (size_t i = 0; i < digits; ++i) {
            auto h = hex.peek(i);
            if (!h || !is_hex(*h)) {
                return ParseError("Invalid Unicode escape (expected " +
                                  std::to_string(digits) + " hex digits)",
                                  hex, {"0-9", "a-f", "A-F"});
            }
            char d = *h;
            cp = cp * 16 + static_cast<uint32_t>(
                is_digit(d) ? d - '0' : (d | 0x20) - 'a' + 10);
        }
        if (cp > 0x10FFFF) {
            return ParseError("Invalid Unicode code point: U+" +
                              hex.slice(hex.pos(), hex.pos() + digits) +
                              " (max U+10FFFF)", hex);
        }
        // Lone surrogates cannot be encoded as UTF-8
        if (cp >= 0xD800 && cp <= 0xDFFF) cp = 0xFFFD;
        std::string out;
        append_utf8(out, cp);
        return success(std::move(out), hex.advance(digits));
    }
    default:
        return ParseError(std::string("Invalid escape sequence: \\") + ch, c,
                          {"\\\"", "\\\\", "\\n", "\\t", "\\u", "\\U"});
    }
}

ParseResult<std::string> parse_string_literal(Cursor c) {
    Cursor open = c;
    c = c.advance();
    std::string value;
    while (true) {
        if (c.is_eof() || is_line_end(c.current())) {
            return ParseError("Unterminated string literal", open, {"\""});
        }
        char ch = c.current();
        if (ch == '"') return success(std::move(value), c.advance());
        if (ch == '\\') {
            auto esc = parse_escape_sequence(c);
            if (esc.is_err()) return std::move(esc).error();
            value += esc.value().value;
            c = esc.value().cursor;
            continue;
        }
        value += ch;
        c = c.advance();
    }
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

ParseResult<Pattern> parse_pattern(Cursor c, PatternMode mode, int depth);
ParseResult<ExprPtr> parse_inline_expression(Cursor c, int depth);

std::string literal_only_message(const std::string& name) {
    return "Named argument '" + name + "' requires a literal value "
           "(string or number), not a variable or reference. "
           "To choose a value at runtime, use a select expression around "
           "the call, see https://projectfluent.org/fluent/guide/selectors.html";
}

// Cursor is at '('
ParseResult<CallArguments> parse_call_arguments(Cursor c, int depth) {
    if (depth >= kMaxNesting) {
        return ParseError("Call arguments nested too deeply", c);
    }
    ++depth;
    c = skip_blank(c.advance());
    CallArguments args;
    if (c.at(')')) return success(std::move(args), c.advance());

    while (true) {
        Cursor arg_start = c;
        auto er = parse_inline_expression(c, depth);
        if (er.is_err()) return std::move(er).error();
        ExprPtr expr = er.value().value;
        c = skip_blank(er.value().cursor);

        if (c.at(':')) {
            const auto* ref = expr->get_if<MessageReference>();
            if (!ref || ref->attribute) {
                return ParseError("Named argument name must be an identifier", arg_start);
            }
            std::string name = ref->id;
            c = skip_blank(c.advance());

            Cursor value_start = c;
            auto vr = parse_inline_expression(c, depth);
            if (vr.is_err()) return std::move(vr).error();

            Literal lit;
            const Expression& value = *vr.value().value;
            if (const auto* s = value.get_if<StringLiteral>()) {
                lit = *s;
            } else if (const auto* n = value.get_if<NumberLiteral>()) {
                lit = *n;
            } else {
                return ParseError(literal_only_message(name), value_start);
            }

            bool duplicate = std::any_of(args.named.begin(), args.named.end(),
                [&](const NamedArgument& a) { return a.name == name; });
            if (duplicate) {
                return ParseError("Duplicate named argument: '" + name + "'", arg_start);
            }
            args.named.push_back(NamedArgument{std::move(name), std::move(lit)});
            c = skip_blank(vr.value().cursor);
        } else {
            if (!args.named.empty()) {
                return ParseError("Positional arguments must come before named arguments",
                                  arg_start);
            }
            args.positional.push_back(std::move(expr));
        }

        if (c.at(',')) {
            c = skip_blank(c.advance());
            if (c.at(')')) return success(std::move(args), c.advance());
            continue;
        }
        if (c.at(')')) return success(std::move(args), c.advance());
        return ParseError("Expected ',' or ')' in argument list", c, {",", ")"});
    }
}

// Cursor is at '-' followed by a letter
ParseResult<ExprPtr> parse_term_reference(Cursor c, int depth) {
    Cursor start = c;
    auto id = parse_identifier(c.advance());
    if (id.is_err()) return std::move(id).error();
    c = id.value().cursor;

    TermReference ref;
    ref.id = std::move(id.value().value);

    if (c.at('.')) {
        auto attr = parse_identifier(c.advance());
        if (attr.is_err()) return std::move(attr).error();
        ref.attribute = std::move(attr.value().value);
        c = attr.value().cursor;
    }

    Cursor look = skip_blank_inline(c);
    if (look.at('(')) {
        auto args = parse_call_arguments(look, depth);
        if (args.is_err()) return std::move(args).error();
        ref.arguments = std::move(args.value().value);
        c = args.value().cursor;
    }

    return success(make_expr(std::move(ref), Span{start.pos(), c.pos()}), c);
}

ParseResult<ExprPtr> parse_inline_expression(Cursor c, int depth) {
    Cursor start = c;
    if (c.is_eof()) {
        return ParseError("Expected expression", c, {"$", "\"", "-", "0-9", "a-z", "A-Z"});
    }
    char ch = c.current();

    if (ch == '$') {
        auto id = parse_identifier(c.advance());
        if (id.is_err()) return std::move(id).error();
        Cursor end = id.value().cursor;
        return success(make_expr(VariableReference{std::move(id.value().value)},
                                 Span{start.pos(), end.pos()}), end);
    }

    if (ch == '"') {
        auto str = parse_string_literal(c);
        if (str.is_err()) return std::move(str).error();
        Cursor end = str.value().cursor;
        return success(make_expr(StringLiteral{std::move(str.value().value)},
                                 Span{start.pos(), end.pos()}), end);
    }

    // One char of lookahead separates "-term" from "-1"
    if (ch == '-' && next_is_letter(c, 1)) {
        return parse_term_reference(c, depth);
    }

    if (ch == '-' || is_digit(ch)) {
        auto num = parse_number(c);
        if (num.is_err()) return std::move(num).error();
        Cursor end = num.value().cursor;
        return success(make_expr(std::move(num.value().value),
                                 Span{start.pos(), end.pos()}), end);
    }

    if (is_ascii_letter(ch)) {
        auto id = parse_identifier(c);
        if (id.is_err()) return std::move(id).error();
        std::string name = std::move(id.value().value);
        c = id.value().cursor;

        Cursor look = skip_blank_inline(c);
        if (is_uppercase_identifier(name) && look.at('(')) {
            auto args = parse_call_arguments(look, depth);
            if (args.is_err()) return std::move(args).error();
            Cursor end = args.value().cursor;
            FunctionReference fn{std::move(name), std::move(args.value().value)};
            return success(make_expr(std::move(fn), Span{start.pos(), end.pos()}), end);
        }

        MessageReference ref{std::move(name), std::nullopt};
        if (c.at('.')) {
            auto attr = parse_identifier(c.advance());
            if (attr.is_err()) return std::move(attr).error();
            ref.attribute = std::move(attr.value().value);
            c = attr.value().cursor;
        }
        return success(make_expr(std::move(ref), Span{start.pos(), c.pos()}), c);
    }

    return ParseError("Expected expression", c, {"$", "\"", "-", "0-9", "a-z", "A-Z"});
}

ParseResult<VariantKey> parse_variant_key(Cursor c) {
    if (c.at('-') || (!c.is_eof() && is_digit(c.current()))) {
        auto num = parse_number(c);
        if (num.is_err()) return std::move(num).error();
        return success(VariantKey{std::move(num.value().value)}, num.value().cursor);
    }
    auto id = parse_identifier(c);
    if (id.is_err()) {
        return ParseError("Expected variant key (identifier or number)", c,
                          {"a-z", "A-Z", "0-9"});
    }
    return success(VariantKey{std::move(id.value().value)}, id.value().cursor);
}

ParseResult<Variant> parse_variant(Cursor c, int depth) {
    Cursor start = c;
    Variant variant;
    if (c.at('*')) {
        variant.is_default = true;
        c = c.advance();
    }
    if (!c.at('[')) {
        return ParseError("Expected '[' at start of variant", c, {"["});
    }

    auto key = parse_variant_key(skip_blank_inline(c.advance()));
    if (key.is_err()) return std::move(key).error();
    variant.key = std::move(key.value().value);

    c = skip_blank_inline(key.value().cursor);
    if (!c.at(']')) {
        return ParseError("Expected ']' after variant key", c, {"]"});
    }

    c = skip_pattern_start(c.advance(), PatternMode::Variant);
    auto pattern = parse_pattern(c, PatternMode::Variant, depth);
    if (pattern.is_err()) return std::move(pattern).error();
    variant.value = std::move(pattern.value().value);
    c = pattern.value().cursor;

    variant.span = Span{start.pos(), c.pos()};
    return success(std::move(variant), c);
}

// Cursor is just past "->". Stops at the closing '}' without consuming it.
ParseResult<ExprPtr> parse_select_expression(Cursor c, ExprPtr selector,
                                             size_t start, int depth) {
    std::vector<Variant> variants;
    while (true) {
        c = skip_blank(c);
        if (c.is_eof()) {
            return ParseError("Unterminated select expression", c, {"[", "*[", "}"});
        }
        if (c.at('}')) break;
        if (!c.at('[') && !c.at('*')) {
            return ParseError("Expected variant", c, {"[", "*["});
        }
        auto v = parse_variant(c, depth);
        if (v.is_err()) return std::move(v).error();
        variants.push_back(std::move(v.value().value));
        c = v.value().cursor;
    }

    if (variants.empty()) {
        return ParseError("Select expression must have at least one variant", c, {"[", "*["});
    }

    auto defaults = std::count_if(variants.begin(), variants.end(),
                                  [](const Variant& v) { return v.is_default; });
    if (defaults == 0) {
        return ParseError(
            "Select expression must have exactly one default variant (marked with *)",
            c, {"*["});
    }
    if (defaults > 1) {
        return ParseError(
            "Select expression must have exactly one default variant, found multiple", c);
    }

    SelectExpression select{std::move(selector), std::move(variants)};
    return success(make_expr(std::move(select), Span{start, c.pos()}), c);
}

// Cursor is at '{'
ParseResult<ExprPtr> parse_placeable(Cursor c, int depth) {
    if (depth >= kMaxNesting) {
        return ParseError("Placeables nested too deeply", c);
    }

    c = skip_blank(c.advance());
    size_t expr_start = c.pos();
    auto er = parse_inline_expression(c, depth + 1);
    if (er.is_err()) return std::move(er).error();

    ExprPtr expr = er.value().value;
    c = skip_blank(er.value().cursor);

    if (c.at('-') && c.peek(1) == '>') {
        auto sr = parse_select_expression(c.advance(2), std::move(expr),
                                          expr_start, depth + 1);
        if (sr.is_err()) return std::move(sr).error();
        expr = sr.value().value;
        c = sr.value().cursor;
    }

    if (!c.at('}')) {
        return ParseError("Expected '}'", c, {"}"});
    }
    return success(std::move(expr), c.advance());
}

// ---------------------------------------------------------------------------
// Patterns
// ---------------------------------------------------------------------------

ParseResult<Pattern> parse_pattern(Cursor c, PatternMode mode, int depth) {
    Pattern pattern;
    auto& elements = pattern.elements;

    auto append_text = [&elements](std::string text) {
        if (!elements.empty()) {
            if (auto* last = std::get_if<TextElement>(&elements.back())) {
                last->value += text;
                return;
            }
        }
        elements.push_back(TextElement{std::move(text)});
    };

    auto stops_text = [mode](char ch) {
        if (ch == '{' || ch == '}' || is_line_end(ch)) return true;
        return mode == PatternMode::Variant && (ch == '[' || ch == '*');
    };

    while (!c.is_eof()) {
        char ch = c.current();

        if (is_line_end(ch)) {
            if (!is_indented_continuation(c, mode)) break;
            // The line break and indentation collapse to one space
            c = skip_blank_inline(skip_line_end(c));
            append_text(" ");
            continue;
        }

        if (ch == '{') {
            auto pr = parse_placeable(c, depth);
            if (pr.is_err()) return std::move(pr).error();
            elements.push_back(Placeable{pr.value().value});
            c = pr.value().cursor;
            continue;
        }

        if (ch == '}') {
            if (mode == PatternMode::Variant) break;
            return ParseError("Unbalanced closing brace", c);
        }

        if (stops_text(ch)) break;

        Cursor start = c;
        while (!c.is_eof() && !stops_text(c.current())) c = c.advance();
        append_text(start.slice_to(c.pos()));
    }

    if (!elements.empty()) {
        if (auto* last = std::get_if<TextElement>(&elements.back())) {
            size_t keep = last->value.find_last_not_of(' ');
            if (keep == std::string::npos) {
                elements.pop_back();
            } else {
                last->value.erase(keep + 1);
            }
        }
    }

    return success(std::move(pattern), c);
}

// ---------------------------------------------------------------------------
// Entries
// ---------------------------------------------------------------------------

// Cursor is at '.'
ParseResult<Attribute> parse_attribute(Cursor c) {
    Cursor start = c;
    auto id = parse_identifier(c.advance());
    if (id.is_err()) return std::move(id).error();

    c = skip_blank_inline(id.value().cursor);
    if (!c.at('=')) {
        return ParseError("Expected '=' after attribute identifier", c, {"="});
    }

    c = skip_pattern_start(c.advance(), PatternMode::Entry);
    auto pattern = parse_pattern(c, PatternMode::Entry, 0);
    if (pattern.is_err()) return std::move(pattern).error();
    c = pattern.value().cursor;

    if (pattern.value().value.empty()) {
        return ParseError("Attribute \"." + id.value().value + "\" must have a value", c);
    }

    Attribute attr{std::move(id.value().value), std::move(pattern.value().value),
                   Span{start.pos(), c.pos()}};
    return success(std::move(attr), c);
}

// Zero or more indented ".name = pattern" lines. Cursor is at the end of the
// value line.
ParseResult<std::vector<Attribute>> parse_attributes(Cursor c) {
    std::vector<Attribute> attrs;
    while (!c.is_eof() && is_line_end(c.current())) {
        Cursor look = skip_blank(c);
        if (!look.at('.')) break;
        size_t p = look.pos();
        if (p == 0 || look.source()[p - 1] != ' ') break;

        auto attr = parse_attribute(look);
        if (attr.is_err()) return std::move(attr).error();
        attrs.push_back(std::move(attr.value().value));
        c = attr.value().cursor;
    }
    return success(std::move(attrs), c);
}

ParseResult<Message> parse_message(Cursor c) {
    Cursor start = c;
    auto id = parse_identifier(c);
    if (id.is_err()) return std::move(id).error();

    c = skip_blank_inline(id.value().cursor);
    if (!c.at('=')) {
        return ParseError("Expected '=' after message identifier", c, {"="});
    }

    c = skip_pattern_start(c.advance(), PatternMode::Entry);
    auto pattern = parse_pattern(c, PatternMode::Entry, 0);
    if (pattern.is_err()) return std::move(pattern).error();

    auto attrs = parse_attributes(pattern.value().cursor);
    if (attrs.is_err()) return std::move(attrs).error();
    c = attrs.value().cursor;

    Message msg;
    msg.id = std::move(id.value().value);
    if (!pattern.value().value.empty()) msg.value = std::move(pattern.value().value);
    msg.attributes = std::move(attrs.value().value);
    msg.span = Span{start.pos(), c.pos()};

    if (!msg.value && msg.attributes.empty()) {
        return ParseError("Message \"" + msg.id +
                          "\" must have either a value or at least one attribute", start);
    }
    return success(std::move(msg), c);
}

// Cursor is at '-'
ParseResult<Term> parse_term(Cursor c) {
    Cursor start = c;
    auto id = parse_identifier(c.advance());
    if (id.is_err()) return std::move(id).error();

    c = skip_blank_inline(id.value().cursor);
    if (!c.at('=')) {
        return ParseError("Expected '=' after term identifier", c, {"="});
    }

    c = skip_pattern_start(c.advance(), PatternMode::Entry);
    auto pattern = parse_pattern(c, PatternMode::Entry, 0);
    if (pattern.is_err()) return std::move(pattern).error();
    if (pattern.value().value.empty()) {
        return ParseError("Expected term \"-" + id.value().value + "\" to have a value",
                          pattern.value().cursor);
    }

    auto attrs = parse_attributes(pattern.value().cursor);
    if (attrs.is_err()) return std::move(attrs).error();
    c = attrs.value().cursor;

    Term term;
    term.id = std::move(id.value().value);
    term.value = std::move(pattern.value().value);
    term.attributes = std::move(attrs.value().value);
    term.span = Span{start.pos(), c.pos()};
    return success(std::move(term), c);
}

size_t count_hashes(const Cursor& c) {
    size_t n = 0;
    while (c.peek(n) == '#') ++n;
    return n;
}

// Cursor is at '#'. Consecutive lines with the same number of '#' merge
// into one comment.
ParseResult<Comment> parse_comment(Cursor c) {
    Cursor start = c;
    size_t hashes = count_hashes(c);
    if (hashes > 3) {
        return ParseError("Comment has too many '#' characters (maximum is 3)",
                          c.advance(3), {"#", "##", "###"});
    }

    Comment comment;
    comment.kind = hashes == 1 ? CommentKind::Line
                 : hashes == 2 ? CommentKind::Group
                               : CommentKind::Resource;

    std::string content;
    bool first = true;
    while (true) {
        c = c.advance(hashes);
        if (c.at(' ')) c = c.advance();
        Cursor line_start = c;
        c = skip_to_line_end(c);
        if (!first) content += '\n';
        content += line_start.slice_to(c.pos());
        first = false;

        Cursor next = skip_line_end(c);
        if (next.pos() == c.pos() || count_hashes(next) != hashes) break;
        auto after = next.peek(hashes);
        if (after && *after != ' ' && !is_line_end(*after)) break;
        c = next;
    }

    comment.content = std::move(content);
    comment.span = Span{start.pos(), c.pos()};
    return success(std::move(comment), c);
}

// Junk recovery: the first line unconditionally, then every following line
// until one that can start an entry.
Cursor consume_junk_lines(Cursor c) {
    c = skip_line_end(skip_to_line_end(c));
    while (!c.is_eof()) {
        char ch = c.current();
        if (ch == '#' || ch == '-' || is_ascii_letter(ch)) break;
        c = skip_line_end(skip_to_line_end(c));
    }
    return c;
}

template<typename T>
ParseResult<Entry> as_entry(ParseResult<T> r) {
    if (r.is_err()) return std::move(r).error();
    Cursor end = r.value().cursor;
    return success(Entry{std::move(r.value().value)}, end);
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

ParseResult<Entry> parse_entry(Cursor cursor) {
    if (cursor.at('#')) return as_entry(parse_comment(cursor));
    if (cursor.at('-')) return as_entry(parse_term(cursor));
    return as_entry(parse_message(cursor));
}

Resource parse(std::string_view source) {
    Resource resource;
    Cursor c(source);

    while (true) {
        c = skip_blank(c);
        if (c.is_eof()) break;

        auto entry = parse_entry(c);
        if (entry.is_ok()) {
            resource.entries.push_back(std::move(entry.value().value));
            c = entry.value().cursor;
            continue;
        }

        const ParseError& err = entry.error();
        Cursor end = consume_junk_lines(c);

        Junk junk;
        junk.content = c.slice_to(end.pos());
        junk.annotations.push_back(Annotation{
            "E0099", err.message, Span{err.cursor.pos(), err.cursor.pos()}});
        junk.span = Span{c.pos(), end.pos()};
        resource.entries.push_back(std::move(junk));
        c = end;
    }

    return resource;
}

} // namespace ftl
