#pragma once

#include <string>

namespace weft {

struct WeftError {
    enum Code {
        InvalidArg,
        OutOfRange,
        Pattern,
        Duplicate,
        NotFound,
        Parse,
        Config,
        IO
    };

    Code code;
    std::string message;
    std::string hint;

    WeftError() = default;
    WeftError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    WeftError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace weft
