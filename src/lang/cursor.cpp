#include <ftl/lang/cursor.hpp>
#include <stdexcept>

namespace ftl {

char Cursor::current() const {
    if (is_eof()) {
        throw std::out_of_range(
            "Cursor::current() at end of input (pos " + std::to_string(pos_) + ")");
    }
    return source_[pos_];
}

std::string Cursor::slice(size_t from, size_t to) const {
    if (to > source_.size()) to = source_.size();
    if (from >= to) return {};
    return std::string(source_.substr(from, to - from));
}

std::pair<size_t, size_t> Cursor::line_col() const {
    size_t line = 1;
    size_t line_start = 0;
    for (size_t i = 0; i < pos_; ++i) {
        if (source_[i] == '\n') {
            ++line;
            line_start = i + 1;
        }
    }
    return {line, pos_ - line_start + 1};
}

std::string ParseError::format() const {
    auto [line, col] = cursor.line_col();
    std::string out = std::to_string(line) + ":" + std::to_string(col) + ": " + message;
    if (!expected.empty()) {
        out += " (expected: ";
        for (size_t i = 0; i < expected.size(); ++i) {
            if (i > 0) out += ", ";
            out += "'" + expected[i] + "'";
        }
        out += ")";
    }
    return out;
}

std::string ParseError::format_with_context() const {
    std::string_view src = cursor.source();
    size_t pos = cursor.pos();

    size_t begin = pos;
    while (begin > 0 && src[begin - 1] != '\n') --begin;
    size_t end = pos;
    while (end < src.size() && src[end] != '\n' && src[end] != '\r') ++end;

    auto [line, col] = cursor.line_col();
    std::string gutter = std::to_string(line);

    std::string out = format();
    out += "\n";
    out += gutter + " | " + std::string(src.substr(begin, end - begin)) + "\n";
    out += std::string(gutter.size(), ' ') + " | " + std::string(col - 1, ' ') + "^";
    return out;
}

} // namespace ftl
