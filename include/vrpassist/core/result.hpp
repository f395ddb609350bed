#pragma once

#include "errors.hpp"

#include <optional>
#include <stdexcept>
#include <variant>

namespace vrpassist::core {

namespace detail {

[[noreturn]] inline void bad_result_access(const char* what) {
    throw std::logic_error(what);
}

}  // namespace detail

// Value of a fallible operation, or the Error that stopped it.
// Accessing the wrong side throws std::logic_error.
template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    static Result err(ErrorCode code, std::string message) {
        return Result(E{code, std::move(message)});
    }

    static Result err(ErrorCode code, std::string message, std::string context) {
        return Result(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { check_ok(); return std::get<0>(data_); }
    const T& value() const& { check_ok(); return std::get<0>(data_); }
    T&& value() && { check_ok(); return std::get<0>(std::move(data_)); }

    E& error() & { check_err(); return std::get<1>(data_); }
    const E& error() const& { check_err(); return std::get<1>(data_); }
    E&& error() && { check_err(); return std::get<1>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

private:
    std::variant<T, E> data_;

    void check_ok() const {
        if (!is_ok()) detail::bad_result_access("Result holds an error");
    }

    void check_err() const {
        if (!is_err()) detail::bad_result_access("Result holds a value");
    }
};

// Success or an Error, for operations without a value
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}

    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    static Result err(ErrorCode code, std::string message) {
        return Result(E{code, std::move(message)});
    }

    static Result err(ErrorCode code, std::string message, std::string context) {
        return Result(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    const E& error() const& {
        if (!error_) detail::bad_result_access("Result holds no error");
        return *error_;
    }

    E&& error() && {
        if (!error_) detail::bad_result_access("Result holds no error");
        return std::move(*error_);
    }

private:
    std::optional<E> error_;
};

}  // namespace vrpassist::core
