#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace gzs {

/// Value of type T or an Error. Result<void> carries only the error.
///
/// Errors convert implicitly, so a function can `return Error(...)` or
/// forward `other.error()` directly.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    /// Move the value out (for move-only T such as unique_ptr).
    T take() { return std::move(std::get<T>(data_)); }

    const Error& error() const { return std::get<Error>(data_); }
    bool failed_with(ErrorKind kind) const { return !ok() && error().is(kind); }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *err_; }
    bool failed_with(ErrorKind kind) const { return !ok() && err_->is(kind); }

private:
    std::optional<Error> err_;
};

} // namespace gzs
