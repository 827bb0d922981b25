#pragma once

#include <depot/error.hpp>
#include <variant>
#include <utility>

namespace depot {

template<typename T>
class Result {
    std::variant<T, DepotError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from DepotError so DEPOT_TRY can forward errors across Result<T> types
    Result(DepotError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(DepotError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<DepotError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    DepotError& error() & { return std::get<DepotError>(data_); }
    const DepotError& error() const& { return std::get<DepotError>(data_); }
    DepotError&& error() && { return std::get<DepotError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define DEPOT_TRY(expr) \
    do { \
        auto _depot_result = (expr); \
        if (_depot_result.is_err()) return std::move(_depot_result).error(); \
    } while(0)

} // namespace depot
