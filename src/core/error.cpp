/*
 * Error types implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/core/error.hpp>

namespace shellkit {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Syntax: return "syntax";
        case ErrorKind::RecursionExceeded: return "recursion";
        case ErrorKind::Dispatch: return "dispatch";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Job: return "job";
        case ErrorKind::Io: return "io";
    }
    return "unknown";
}

} // namespace shellkit
