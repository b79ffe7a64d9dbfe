#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ftl {

// ---------------------------------------------------------------------------
// Cursor: immutable position in a source buffer
// ---------------------------------------------------------------------------
//
// Every operation returns a new Cursor. The source buffer must outlive all
// cursors over it.
class Cursor {
public:
    Cursor() = default;
    explicit Cursor(std::string_view source, size_t pos = 0)
        : source_(source), pos_(pos < source.size() ? pos : source.size()) {}

    std::string_view source() const { return source_; }
    size_t pos() const { return pos_; }

    bool is_eof() const { return pos_ >= source_.size(); }

    // Throws std::out_of_range at end of input. Callers check is_eof() or
    // use peek().
    char current() const;

    std::optional<char> peek(size_t offset = 0) const {
        if (offset >= source_.size() - pos_) return std::nullopt;
        return source_[pos_ + offset];
    }

    // True when not at EOF and the current char equals c
    bool at(char c) const { return pos_ < source_.size() && source_[pos_] == c; }

    Cursor advance(size_t count = 1) const {
        size_t remaining = source_.size() - pos_;
        return Cursor(source_, pos_ + (count < remaining ? count : remaining));
    }

    std::string slice(size_t from, size_t to) const;
    std::string slice_to(size_t to) const { return slice(pos_, to); }

    // 1-based (line, column). O(pos); diagnostics only.
    std::pair<size_t, size_t> line_col() const;

private:
    std::string_view source_;
    size_t pos_ = 0;
};

// ---------------------------------------------------------------------------
// ParseError: failure of a grammar rule at a cursor position
// ---------------------------------------------------------------------------

struct ParseError {
    std::string message;
    Cursor cursor;
    std::vector<std::string> expected;

    ParseError() = default;
    ParseError(std::string msg, Cursor c, std::vector<std::string> exp = {})
        : message(std::move(msg)), cursor(c), expected(std::move(exp)) {}

    // "line:col: message (expected: 'a', 'b')"
    std::string format() const;

    // format() followed by the offending source line and a caret under the
    // failing column.
    std::string format_with_context() const;
};

} // namespace ftl
