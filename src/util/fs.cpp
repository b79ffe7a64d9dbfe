#include <ftl/fs.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace ftl {

Result<std::string> read_text_file(const std::string& path, const std::string& what) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return FtlError(FtlError::NotFound, what + " not found: " + path).at(path);
    }
    if (fs::is_directory(path, ec)) {
        return FtlError(FtlError::IO, what + " is a directory: " + path,
                        "give the path of a file inside it").at(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return FtlError(FtlError::IO, "cannot open " + what + ": " + path,
                        std::strerror(errno)).at(path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return FtlError(FtlError::IO, "error reading " + what + ": " + path).at(path);
    }
    return Result<std::string>::ok(ss.str());
}

} // namespace ftl
