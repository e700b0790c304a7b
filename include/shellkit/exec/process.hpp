/*
 * OS process execution - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Runs an external program in its own process group with stdout and
 *   stderr captured through one pipe. Cancelling the context sends SIGTERM
 *   to the group.
 */
#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <sys/types.h>
#include <vector>
#include <shellkit/core/context.hpp>
#include <shellkit/core/error.hpp>

namespace shellkit {

struct ProcessResult {
    pid_t pid = -1;
    int exit_code = -1;   // 128+signal when terminated by a signal
    Status error;         // not found, spawn failure, cancellation or non-zero exit
};

using OutputFn = std::function<void(const char* data, std::size_t len)>;
// Called once the child exists; returning false terminates it.
using StartFn = std::function<bool(pid_t pid)>;

// input, when not null, is written to the child's stdin (otherwise
// /dev/null). Blocks until the child exits.
ProcessResult run_process(const std::vector<std::string>& argv, const std::string* input, const Context& ctx,
                          const OutputFn& on_output, const StartFn& on_start = {});

} // namespace shellkit
