#include <weft/error.hpp>

namespace weft {

const char* WeftError::code_name(Code c) {
    switch (c) {
        case InvalidArg: return "InvalidArg";
        case OutOfRange: return "OutOfRange";
        case Pattern:    return "Pattern";
        case Duplicate:  return "Duplicate";
        case NotFound:   return "NotFound";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case IO:         return "IO";
    }
    return "Unknown";
}

std::string WeftError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace weft
