#pragma once

#include <ftl/lang/ast.hpp>
#include <string>

namespace ftl {

// Render a Resource back to canonical FTL text. parse(serialize(r)) yields
// a resource that serializes to the same text.
std::string serialize(const Resource& resource);

std::string serialize(const Pattern& pattern);
std::string serialize(const Expression& expr);

} // namespace ftl
