// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <source_location>
#include <string>
#include <utility>
#include <variant>

#include "kestrel/core/error.h"

namespace kestrel::core {

enum class ErrorKind {
    Io,      // file missing, unreadable or unwritable
    Parse,   // bytes were read but could not be decoded
    Invalid, // the request itself was rejected
};

/**
 * A recoverable failure of an I/O style call. Carries the call site so a
 * caller that escalates it can still point at where it was raised.
 */
class Error {
public:
    ErrorKind Kind = ErrorKind::Io;
    std::string Message;
    std::source_location Location;

    Error(std::string message,
          ErrorKind kind = ErrorKind::Io,
          std::source_location location = std::source_location::current())
        : Kind(kind), Message(std::move(message)), Location(location) {}

    Error WithContext(const std::string& context) const {
        return Error(context + ": " + Message, Kind, Location);
    }

    std::string Describe() const {
        return Message + " (" + Location.file_name() + ":" + std::to_string(Location.line()) + ")";
    }
};

/**
 * Value or Error. Used where the caller picks the failure policy (image and
 * capsule files); everything else throws a KestrelError directly.
 *
 * Escalating an Err through Value() or Expect() throws KestrelError.
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    static Result Ok(T value) { return Result(std::move(value)); }
    static Result Err(Error error) { return Result(std::move(error)); }
    static Result Err(std::string message, ErrorKind kind = ErrorKind::Io,
                      std::source_location location = std::source_location::current()) {
        return Result(Error(std::move(message), kind, location));
    }

    bool IsOk() const noexcept { return std::holds_alternative<T>(data_); }
    bool IsErr() const noexcept { return !IsOk(); }
    explicit operator bool() const noexcept { return IsOk(); }

    T& Value() & {
        ThrowIfErr();
        return std::get<T>(data_);
    }

    const T& Value() const & {
        ThrowIfErr();
        return std::get<T>(data_);
    }

    T&& Value() && {
        ThrowIfErr();
        return std::get<T>(std::move(data_));
    }

    const Error& GetError() const { return std::get<Error>(data_); }

    T ValueOr(T fallback) const & { return IsOk() ? std::get<T>(data_) : std::move(fallback); }

    T Expect(const std::string& what) && {
        if (IsErr()) {
            throw KestrelError(what + ": " + GetError().Describe());
        }
        return std::get<T>(std::move(data_));
    }

    Result WithContext(const std::string& context) && {
        if (IsErr()) {
            return Result(GetError().WithContext(context));
        }
        return std::move(*this);
    }

private:
    void ThrowIfErr() const {
        if (IsErr()) {
            throw KestrelError(GetError().Describe());
        }
    }

    std::variant<T, Error> data_;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    static Result Ok() { return Result(); }
    static Result Err(Error error) { return Result(std::move(error)); }
    static Result Err(std::string message, ErrorKind kind = ErrorKind::Io,
                      std::source_location location = std::source_location::current()) {
        return Result(Error(std::move(message), kind, location));
    }

    bool IsOk() const noexcept { return std::holds_alternative<std::monostate>(error_); }
    bool IsErr() const noexcept { return !IsOk(); }
    explicit operator bool() const noexcept { return IsOk(); }

    const Error& GetError() const { return std::get<Error>(error_); }

    void Expect(const std::string& what) const {
        if (IsErr()) {
            throw KestrelError(what + ": " + GetError().Describe());
        }
    }

private:
    std::variant<std::monostate, Error> error_;
};

} // namespace kestrel::core
