#include <ftl/error.hpp>

namespace ftl {

const char* FtlError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case NotFound:   return "NotFound";
        case Duplicate:  return "Duplicate";
        case Cycle:      return "Cycle";
        case InvalidArg: return "InvalidArg";
        case Locale:     return "Locale";
    }
    return "Unknown";
}

FtlError& FtlError::at(std::string f, int l, int col) & {
    file = std::move(f);
    line = l;
    column = l > 0 ? col : 0;
    return *this;
}

FtlError&& FtlError::at(std::string f, int l, int col) && {
    return std::move(at(std::move(f), l, col));
}

std::string FtlError::format() const {
    std::string out = "error[" + std::string(code_name(code)) + "]: " + message;
    if (!hint.empty()) out += "\n  hint: " + hint;
    if (file.empty()) return out;

    out += "\n  --> " + file;
    if (line > 0) {
        out += ":" + std::to_string(line);
        if (column > 0) out += ":" + std::to_string(column);
    }
    return out;
}

} // namespace ftl
