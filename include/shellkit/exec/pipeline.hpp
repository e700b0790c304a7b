/*
 * Pipeline executor - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Runs parsed chains. Within a chain each stage receives the previous
 *   stage's captured output as input; the first stage has none. The context
 *   is checked before every stage. A chain's output is written through to
 *   its redirect target and still returned. Execution stops at the first
 *   failing chain, returning the output accumulated so far with the error.
 */
#pragma once
#include <functional>
#include <string>
#include <shellkit/core/context.hpp>
#include <shellkit/core/error.hpp>
#include <shellkit/core/var_store.hpp>
#include <shellkit/exec/dispatcher.hpp>
#include <shellkit/exec/redir.hpp>
#include <shellkit/expand/expand.hpp>
#include <shellkit/parse/ast.hpp>

namespace shellkit {

using ArgExpander = std::function<Expansion(const std::string& arg, VariableStore* scope)>;
// Starts a chain marked with '&' as a job and returns the job id.
using BackgroundLauncher = std::function<int(const Chain& chain, VariableStore* scope)>;
// Receives each completed chain's output as soon as it is available.
using ChainSink = std::function<void(const std::string& output)>;

class PipelineExecutor {
public:
    PipelineExecutor(const Dispatcher& dispatcher, FileHandler& files);

    void set_arg_expander(ArgExpander fn) { m_expand_arg = std::move(fn); }
    void set_background_launcher(BackgroundLauncher fn) { m_launch = std::move(fn); }
    void set_file_handler(FileHandler& files) { m_files = &files; }

    ExecResult run(const Context& ctx, const ParseResult& parsed, VariableStore* scope,
                   const ChainSink& sink = {}) const;
    // Runs one chain in the foreground, ignoring its background flag.
    ExecResult run_chain(const Context& ctx, const Chain& chain, VariableStore* scope) const;

private:
    const Dispatcher& m_dispatcher;
    FileHandler* m_files;
    ArgExpander m_expand_arg;
    BackgroundLauncher m_launch;
};

Error cancelled_error(const Context& ctx);

} // namespace shellkit
