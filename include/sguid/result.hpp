#pragma once

#include <sguid/error.hpp>
#include <utility>
#include <variant>

namespace sguid {

// Either a value or an SguidError. Library code reports every failure
// through this type; nothing in sguid throws.
template<typename T>
class Result {
    std::variant<T, SguidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SguidError so SGUID_TRY can return errors across Result<T> types
    Result(SguidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SguidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SguidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SguidError& error() & { return std::get<SguidError>(data_); }
    const SguidError& error() const& { return std::get<SguidError>(data_); }
    SguidError&& error() && { return std::get<SguidError>(std::move(data_)); }

    // The value, or `fallback` when this holds an error.
    T value_or(T fallback) const {
        if (is_ok()) return value();
        return fallback;
    }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    // Recovery hook: `f` receives the error and returns a replacement Result.
    template<typename F>
    Result or_else(F&& f) const {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SGUID_TRY(expr) \
    do { \
        auto _sguid_result = (expr); \
        if (_sguid_result.is_err()) return std::move(_sguid_result).error(); \
    } while(0)

} // namespace sguid
