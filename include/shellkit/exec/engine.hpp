/*
 * Command execution engine - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Owns everything one embeddable shell needs: alias table, global
 *   variables, command tree, expander, pipeline executor, recursion
 *   counter and job manager. Several engines may live in one process
 *   without sharing any state.
 *
 *   execute(line) flow: depth check, cancellation check, line expansion,
 *   parse, then chains through the pipeline executor. Nested calls made by
 *   @exec: and $(cmd) come back through execute and count against the same
 *   depth ceiling.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <shellkit/core/config.hpp>
#include <shellkit/core/context.hpp>
#include <shellkit/core/error.hpp>
#include <shellkit/core/var_store.hpp>
#include <shellkit/exec/dispatcher.hpp>
#include <shellkit/exec/job.hpp>
#include <shellkit/exec/pipeline.hpp>
#include <shellkit/exec/redir.hpp>
#include <shellkit/expand/expander.hpp>

namespace shellkit {

// Handed to the host's telemetry/audit collaborator for top-level calls.
struct ExecutionRecord {
    std::string line;
    std::chrono::system_clock::time_point start;
    std::chrono::steady_clock::duration duration{};
    bool success = true;
    std::string error;
    std::string output;
};

using ExecutionObserver = std::function<void(const ExecutionRecord&)>;

class Engine {
public:
    explicit Engine(EngineConfig cfg = {});
    ~Engine();
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Non-cancellable context.
    ExecResult execute(const std::string& line, VariableStore* scope = nullptr);
    ExecResult execute_with_context(const Context& ctx, const std::string& line, VariableStore* scope = nullptr);

    // Runs line as a background job with a copy of scope; returns the job id.
    int spawn(const std::string& line, VariableStore* scope = nullptr);

    Dispatcher& dispatcher() { return m_dispatcher; }
    const Dispatcher& dispatcher() const { return m_dispatcher; }
    VariableStore& variables() { return m_globals; }
    AliasTable& aliases() { return m_aliases; }
    JobManager& jobs() { return *m_jobs; }
    const Expander& expander() const { return m_expander; }
    const EngineConfig& config() const { return m_config; }
    FileHandler& files() { return *m_files; }

    // Configuration-time hooks.
    void add_expander(CustomExpander fn) { m_expander.add_custom(std::move(fn)); }
    void set_file_handler(std::unique_ptr<FileHandler> files);
    void set_observer(ExecutionObserver obs) { m_observer = std::move(obs); }

    int current_depth() const { return m_depth.load(); }
    // Command paths plus alias keys, sorted.
    std::vector<std::string> available_commands() const;

    // "name" and "@name" are equivalent.
    void set_variable(const std::string& name, const std::string& value);
    std::optional<std::string> get_variable(const std::string& name) const;
    bool unset_variable(const std::string& name);

    // $((..)), $(..), $VAR and @name expansion of a value being assigned.
    Expansion expand_value(const std::string& value, VariableStore* scope);

    // name=value lines; path defaults to the configured aliases file.
    Status save_aliases(const std::string& path = "") const;
    Status load_aliases(const std::string& path = "");

private:
    ExecResult execute_impl(const Context& ctx, const std::string& line, VariableStore* scope, const ChainSink& sink);
    // Expand, parse and run without touching the depth counter.
    ExecResult run_line(const Context& ctx, const std::string& line, VariableStore* scope, const ChainSink& sink);
    int launch_chain(const Chain& chain, VariableStore* scope);
    void notify(const std::string& line, std::chrono::system_clock::time_point start, const ExecResult& res) const;

    EngineConfig m_config;
    AliasTable m_aliases;
    VariableStore m_globals;
    Dispatcher m_dispatcher;
    Expander m_expander;
    std::unique_ptr<FileHandler> m_files;
    PipelineExecutor m_pipeline;
    std::atomic<int> m_depth{0};
    ExecutionObserver m_observer;
    std::unique_ptr<JobManager> m_jobs;
};

// Variable key with the '@' prefix.
std::string variable_key(const std::string& name);

} // namespace shellkit
