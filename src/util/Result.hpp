/**
 * @file Result.hpp
 * @brief Value-or-error return type used across the project.
 *
 * Result<T, E> holds either a value of type T or an error of type E. The
 * default error type carries a human readable message. Result<void, E>
 * signals success or failure without a payload.
 *
 * @section Patterns
 * - Expected-style error propagation instead of exceptions at module
 *   boundaries.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace oc {

struct Error {
    Error() = default;
    Error(std::string msg) : message(std::move(msg)) {}
    Error(const char* msg) : message(msg) {}

    std::string message;
};

template <typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool isOk() const {
        return data_.index() == 0;
    }
    bool isErr() const {
        return data_.index() == 1;
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return std::get<0>(data_);
    }
    const T& value() const& {
        return std::get<0>(data_);
    }
    T&& value() && {
        return std::get<0>(std::move(data_));
    }

    T& operator*() & {
        return value();
    }
    const T& operator*() const& {
        return value();
    }
    T&& operator*() && {
        return std::move(*this).value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    const E& error() const {
        return std::get<1>(data_);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> idx, U&& v)
        : data_(idx, std::forward<U>(v)) {}

    std::variant<T, E> data_;
};

template <typename E>
class Result<void, E> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(E error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool isOk() const {
        return !error_.has_value();
    }
    bool isErr() const {
        return error_.has_value();
    }
    explicit operator bool() const {
        return isOk();
    }

    const E& error() const {
        return *error_;
    }

private:
    Result() = default;

    std::optional<E> error_;
};

} // namespace oc
