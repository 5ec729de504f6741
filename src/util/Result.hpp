/**
 * @file Result.hpp
 * @brief Value-or-error return type.
 *
 * Result<T> carries either a value or an Error with a message. Operations
 * that can fail in a way the caller must handle return one of these instead
 * of throwing.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace st {

struct Error {
    std::string message;
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result err(std::string message) {
        return Result(std::in_place_index<1>, Error{std::move(message)});
    }

    bool isOk() const {
        return data_.index() == 0;
    }
    bool isErr() const {
        return !isOk();
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

    T valueOr(T fallback) const {
        return isOk() ? std::get<0>(data_) : std::move(fallback);
    }

    const Error& error() const {
        return std::get<1>(data_);
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

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message) {
        Result r;
        r.error_ = Error{std::move(message)};
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

    const Error& error() const {
        return *error_;
    }

private:
    std::optional<Error> error_;
};

} // namespace st
