#pragma once

#include <ftl/lang/ast.hpp>
#include <ftl/lang/cursor.hpp>
#include <ftl/result.hpp>
#include <string_view>

namespace ftl {

// A successfully parsed node and the cursor just past it
template<typename T>
struct Parsed {
    T value;
    Cursor cursor;
};

template<typename T>
using ParseResult = Result<Parsed<T>, ParseError>;

// Parse FTL source into a Resource. Total: malformed entries become Junk
// and parsing resumes at the next line that can start an entry.
Resource parse(std::string_view source);

// Parse a single entry (message, term or comment) starting exactly at the
// cursor. Returns the structured error instead of producing Junk.
ParseResult<Entry> parse_entry(Cursor cursor);

} // namespace ftl
