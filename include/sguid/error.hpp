#pragma once

#include <string>

namespace sguid {

struct SguidError {
    enum Code {
        InvalidEncoding,
        TamperedEncoding,
        ParseFailure,
        Parse,
        IO,
        Config,
        Database,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;

    SguidError() = default;
    SguidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SguidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace sguid
