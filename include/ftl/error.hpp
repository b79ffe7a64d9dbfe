#pragma once

#include <string>
#include <utility>

namespace ftl {

struct FtlError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        Duplicate,
        Cycle,
        InvalidArg,
        Locale
    };

    Code code = InvalidArg;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    int column = 0;

    FtlError() = default;
    FtlError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    FtlError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    FtlError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Point the error at a file, or a position inside one
    FtlError& at(std::string f, int l = 0, int col = 0) &;
    FtlError&& at(std::string f, int l = 0, int col = 0) &&;

    // error[Code]: message
    //   hint: ...
    //   --> file:line:column
    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace ftl
