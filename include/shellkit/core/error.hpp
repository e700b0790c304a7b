/*
 * Error types - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <utility>

namespace shellkit {

enum class ErrorKind {
    Syntax,            // unbalanced quotes, missing pipe/chain operand, bad redirect
    RecursionExceeded, // nested execute depth above the configured ceiling
    Dispatch,          // unknown verb or the verb itself failed
    Cancelled,         // aborted by request (context cancelled or deadline)
    Job,               // background job failure, surfaced on query
    Io                 // file handler failures (redirect write-through, cat, run)
};

struct Error {
    ErrorKind kind = ErrorKind::Dispatch;
    std::string message;
};

// Empty means success.
using Status = std::optional<Error>;

inline Error make_error(ErrorKind kind, std::string message) { return Error{kind, std::move(message)}; }

const char* to_string(ErrorKind kind);

struct ExecResult {
    std::string output;  // may be partial when error is set
    Status error;
    std::chrono::steady_clock::duration duration{};
    bool ok() const { return !error.has_value(); }
};

} // namespace shellkit
