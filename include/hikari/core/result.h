// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <source_location>
#include <string>
#include <utility>
#include <variant>

#include "hikari/core/error.hpp"

namespace hikari::core {

/**
 * Failure reported by a file-facing operation (image io, scene files).
 *
 * Carries the source location of the statement that produced it, so a
 * message logged far from its origin still points at the right check.
 */
class Error {
public:
    explicit Error(std::string message,
                   std::source_location location = std::source_location::current())
        : Message(std::move(message)), Location(location) {}

    // "message (file:line)"
    std::string Describe() const {
        return Message + " (" + Location.file_name() + ":" + std::to_string(Location.line()) + ")";
    }

    // Prefixes "context: ", keeps the original location
    Error WithContext(const std::string& context) const {
        return Error(context + ": " + Message, Location);
    }

    std::string Message;
    std::source_location Location;
};

/**
 * Either a value or the Error explaining why there is none.
 *
 * Reading the value of a failed result throws HikariError with the
 * described error.
 */
template<typename T>
class Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}

    static Result Ok(T value) { return Result(std::move(value)); }
    static Result Err(Error error) { return Result(std::move(error)); }
    static Result Err(std::string message,
                      std::source_location location = std::source_location::current()) {
        return Result(Error(std::move(message), location));
    }

    bool IsOk() const noexcept { return state_.index() == 0; }
    bool IsErr() const noexcept { return state_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    T& Value() & {
        ThrowIfErr();
        return std::get<0>(state_);
    }

    const T& Value() const & {
        ThrowIfErr();
        return std::get<0>(state_);
    }

    // Moves the value out
    T Unwrap() && {
        ThrowIfErr();
        return std::get<0>(std::move(state_));
    }

    const Error& GetError() const { return std::get<1>(state_); }

    Result WithContext(const std::string& context) && {
        if (IsErr()) {
            return Result(GetError().WithContext(context));
        }
        return std::move(*this);
    }

private:
    void ThrowIfErr() const {
        if (IsErr()) {
            throw HikariError(GetError().Describe());
        }
    }

    std::variant<T, Error> state_;
};

// Outcome of an operation without a value, such as writing a file
template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)), failed_(true) {}

    static Result Ok() { return Result(); }
    static Result Err(std::string message,
                      std::source_location location = std::source_location::current()) {
        return Result(Error(std::move(message), location));
    }

    bool IsOk() const noexcept { return !failed_; }
    bool IsErr() const noexcept { return failed_; }
    explicit operator bool() const noexcept { return IsOk(); }

    const Error& GetError() const { return error_; }

private:
    Error error_{""};
    bool failed_ = false;
};

} // namespace hikari::core
