/*
 * Command execution engine implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/exec/engine.hpp>
#include <shellkit/exec/depth_guard.hpp>
#include <shellkit/core/log.hpp>
#include <shellkit/parse/parser.hpp>
#include <algorithm>
#include <sstream>

namespace shellkit {

namespace {

// Per-thread view of the call in progress: how deeply this thread is nested
// inside execute and which context nested @exec:/$(cmd) calls inherit.
struct CallFrame {
    int nesting = 0;
    const Context* ctx = nullptr;
};
thread_local CallFrame t_frame;

class FrameScope {
public:
    explicit FrameScope(const Context& ctx) : m_saved(t_frame) { ++t_frame.nesting; t_frame.ctx = &ctx; }
    ~FrameScope() { t_frame = m_saved; }
    bool top_level() const { return m_saved.nesting == 0; }
private:
    CallFrame m_saved;
};

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

std::string variable_key(const std::string& name) {
    if (!name.empty() && name[0] == '@') return name;
    return "@" + name;
}

Engine::Engine(EngineConfig cfg)
    : m_config(std::move(cfg)),
      m_expander(m_aliases, m_globals),
      m_files(std::make_unique<LocalFileHandler>()),
      m_pipeline(m_dispatcher, *m_files),
      m_jobs(std::make_unique<JobManager>(m_config.kill_grace)) {
    m_expander.set_exec([this](const std::string& line, VariableStore* scope) {
        Context ctx = t_frame.ctx ? *t_frame.ctx : Context::background();
        return execute_impl(ctx, line, scope, {});
    });
    m_pipeline.set_arg_expander([this](const std::string& arg, VariableStore* scope) {
        return m_expander.expand_variables_only(arg, scope);
    });
    m_pipeline.set_background_launcher([this](const Chain& chain, VariableStore* scope) {
        return launch_chain(chain, scope);
    });
}

Engine::~Engine() {
    // workers reference this engine; stop them before members go away
    m_jobs->shutdown();
}

void Engine::set_file_handler(std::unique_ptr<FileHandler> files) {
    if (!files) return;
    m_files = std::move(files);
    m_pipeline.set_file_handler(*m_files);
}

ExecResult Engine::execute(const std::string& line, VariableStore* scope) {
    return execute_with_context(Context::background(), line, scope);
}

ExecResult Engine::execute_with_context(const Context& ctx, const std::string& line, VariableStore* scope) {
    return execute_impl(ctx, line, scope, {});
}

ExecResult Engine::execute_impl(const Context& ctx, const std::string& line, VariableStore* scope, const ChainSink& sink) {
    const auto start_wall = std::chrono::system_clock::now();
    const auto t0 = std::chrono::steady_clock::now();
    DepthGuard guard(m_depth, m_config.max_exec_depth);
    FrameScope frame(ctx);

    auto done = [&](ExecResult r) {
        r.duration = std::chrono::steady_clock::now() - t0;
        if (frame.top_level()) notify(line, start_wall, r);
        return r;
    };

    ExecResult res;
    if (guard.exceeded()) {
        log_debug("depth " + std::to_string(guard.depth()) + " rejected: " + line);
        res.error = make_error(ErrorKind::RecursionExceeded, guard.message());
        return done(std::move(res));
    }
    return done(run_line(ctx, line, scope, sink));
}

ExecResult Engine::run_line(const Context& ctx, const std::string& line, VariableStore* scope, const ChainSink& sink) {
    ExecResult res;
    if (ctx.cancelled()) {
        res.error = cancelled_error(ctx);
        return res;
    }
    Expansion expanded = m_expander.expand(line, scope);
    if (expanded.error) {
        res.error = expanded.error;
        return res;
    }
    ParseResult parsed = parse_line(expanded.text);
    if (parsed.error) {
        res.error = parsed.error;
        return res;
    }
    return m_pipeline.run(ctx, parsed, scope, sink);
}

void Engine::notify(const std::string& line, std::chrono::system_clock::time_point start, const ExecResult& res) const {
    if (!m_observer) return;
    ExecutionRecord rec;
    rec.line = line; rec.start = start; rec.duration = res.duration;
    rec.success = res.ok();
    if (res.error) rec.error = res.error->message;
    rec.output = res.output;
    m_observer(rec);
}

int Engine::spawn(const std::string& line, VariableStore* scope) {
    std::shared_ptr<VariableStore> scope_copy;
    if (scope) scope_copy = std::make_shared<VariableStore>(scope->snapshot());
    return m_jobs->start(trim(line), [this, line, scope_copy](Job& job, const Context& ctx) -> Status {
        if (!job.mark_running()) return std::nullopt;
        // A job is detached from the call that started it, so it does not
        // hold a unit of the depth budget. Nested @exec:/$(cmd) still count.
        FrameScope frame(ctx);
        std::size_t streamed = 0;
        ExecResult r = run_line(ctx, line, scope_copy.get(), [&](const std::string& out) {
            job.append_output(out);
            streamed += out.size();
        });
        if (r.output.size() > streamed) job.append_output(r.output.substr(streamed));
        return r.error;
    });
}

int Engine::launch_chain(const Chain& chain, VariableStore* scope) {
    auto owned = std::make_shared<Chain>(chain.clone());
    owned->background = false;
    std::shared_ptr<VariableStore> scope_copy;
    if (scope) scope_copy = std::make_shared<VariableStore>(scope->snapshot());
    return m_jobs->start(owned->to_string(), [this, owned, scope_copy](Job& job, const Context& ctx) -> Status {
        if (!job.mark_running()) return std::nullopt;
        FrameScope frame(ctx);
        ExecResult r = m_pipeline.run_chain(ctx, *owned, scope_copy.get());
        job.append_output(r.output);
        return r.error;
    });
}

std::vector<std::string> Engine::available_commands() const {
    std::vector<std::string> out = m_dispatcher.names();
    for (auto& kv : m_aliases.snapshot()) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

void Engine::set_variable(const std::string& name, const std::string& value) {
    m_globals.set(variable_key(name), value);
}

std::optional<std::string> Engine::get_variable(const std::string& name) const {
    return m_globals.get(variable_key(name));
}

bool Engine::unset_variable(const std::string& name) {
    return m_globals.erase(variable_key(name));
}

Expansion Engine::expand_value(const std::string& value, VariableStore* scope) {
    return shellkit::expand_value(value, m_globals, scope, [this](const std::string& line, VariableStore* s) {
        Context ctx = t_frame.ctx ? *t_frame.ctx : Context::background();
        return execute_impl(ctx, line, s, {});
    });
}

Status Engine::save_aliases(const std::string& path) const {
    std::string target = path.empty() ? default_aliases_path(m_config) : path;
    std::ostringstream os;
    for (auto& kv : m_aliases.sorted_snapshot()) {
        if (kv.first.find('=') != std::string::npos || kv.first.find('\n') != std::string::npos ||
            kv.second.find('\n') != std::string::npos) {
            log_warn("alias '" + kv.first + "' cannot be saved as a name=value line, skipped");
            continue;
        }
        os << kv.first << '=' << kv.second << '\n';
    }
    return m_files->write_file(target, os.str(), RedirType::Out);
}

Status Engine::load_aliases(const std::string& path) {
    std::string source = path.empty() ? default_aliases_path(m_config) : path;
    std::string content;
    if (auto err = m_files->read_file(source, content)) return err;
    std::istringstream in(content);
    std::string line; std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        auto eq = t.find('=');
        std::string name = eq == std::string::npos ? "" : trim(t.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : trim(t.substr(eq + 1));
        if (name.empty() || value.empty()) {
            log_warn("skipping invalid alias at " + source + ":" + std::to_string(lineno));
            continue;
        }
        m_aliases.set(name, value);
    }
    return std::nullopt;
}

} // namespace shellkit
