#pragma once

#include <rcat/error.hpp>
#include <utility>
#include <variant>

namespace rcat {

template<typename T>
class Result {
    std::variant<T, RcatError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from RcatError so RCAT_TRY can forward errors between Result types
    Result(RcatError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(RcatError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<RcatError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    RcatError& error() & { return std::get<RcatError>(data_); }
    const RcatError& error() const& { return std::get<RcatError>(data_); }
    RcatError&& error() && { return std::get<RcatError>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define RCAT_TRY(expr) \
    do { \
        auto _rcat_result = (expr); \
        if (_rcat_result.is_err()) return std::move(_rcat_result).error(); \
    } while (0)

// Evaluate a Result<T>, return its error on failure, otherwise move the value into `lhs`.
#define RCAT_TRY_ASSIGN(lhs, expr) \
    do { \
        auto _rcat_result = (expr); \
        if (_rcat_result.is_err()) return std::move(_rcat_result).error(); \
        lhs = std::move(_rcat_result).value(); \
    } while (0)

} // namespace rcat
