#include <sguid/error.hpp>

namespace sguid {

const char* SguidError::code_name(Code c) {
    switch (c) {
        case InvalidEncoding:  return "InvalidEncoding";
        case TamperedEncoding: return "TamperedEncoding";
        case ParseFailure:     return "ParseFailure";
        case Parse:            return "Parse";
        case IO:               return "IO";
        case Config:           return "Config";
        case Database:         return "Database";
        case InvalidArg:       return "InvalidArg";
    }
    return "Unknown";
}

std::string SguidError::format() const {
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

} // namespace sguid
