#pragma once

#include <ftl/result.hpp>
#include <string>

namespace ftl {

// Read a whole file. A missing file is NotFound, anything else that stops
// the read is IO. `what` names the file in messages ("config file").
Result<std::string> read_text_file(const std::string& path, const std::string& what);

} // namespace ftl
