/*
 * Job and process built-in commands - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/exec/builtins.hpp>
#include <shellkit/exec/engine.hpp>
#include <shellkit/exec/pipeline.hpp>
#include <shellkit/exec/process.hpp>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>

namespace shellkit {

namespace {

Error usage_error(const std::string& usage) {
    return make_error(ErrorKind::Dispatch, "usage: " + usage);
}

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << static_cast<double>(ms) / 1000.0 << 's';
    return os.str();
}

std::string format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return os.str();
}

std::string format_pid(pid_t pid) {
    return pid > 0 ? std::to_string(pid) : std::string("-");
}

std::optional<int> parse_job_id(const std::string& s) {
    auto v = parse_integer(s);
    if (!v || *v <= 0 || *v > 1000000000) return std::nullopt;
    return static_cast<int>(*v);
}

Status do_jobs(Engine& engine, Invocation& inv) {
    bool all = false, verbose = false;
    for (auto& a : inv.args) {
        if (a == "-a" || a == "--all") all = true;
        else if (a == "-v" || a == "--verbose") verbose = true;
        else return usage_error("jobs [-a] [-v]");
    }
    auto jobs = engine.jobs().list();
    if (jobs.empty()) { inv.out << "No jobs\n"; return std::nullopt; }
    std::vector<JobSnapshot> shown;
    for (auto& j : jobs) {
        if (all || !is_terminal(j.status)) shown.push_back(std::move(j));
    }
    if (shown.empty()) { inv.out << "No running jobs\n"; return std::nullopt; }

    inv.out << "Background Jobs:\n" << std::string(80, '-') << '\n';
    for (auto& j : shown) {
        inv.out << '[' << j.id << "] [" << to_string(j.status) << "] PID:" << format_pid(j.pid)
                << " Duration:" << format_duration(j.duration) << '\n';
        std::string cmd = j.command;
        if (!verbose && cmd.size() > 60) cmd = cmd.substr(0, 57) + "...";
        inv.out << "    " << cmd << '\n';
        if (verbose) {
            if (j.error) inv.out << "    Error: " << *j.error << '\n';
            auto lines = split_lines(j.output);
            if (!lines.empty()) {
                inv.out << "    Output preview:\n";
                for (std::size_t i = 0; i < lines.size() && i < 3; ++i) inv.out << "      " << lines[i] << '\n';
                if (lines.size() > 3) inv.out << "      ... (" << lines.size() - 3 << " more lines)\n";
            }
        }
    }
    return std::nullopt;
}

void print_job_details(std::ostream& out, const JobSnapshot& j) {
    out << std::string(80, '=') << '\n';
    out << "Job ID:   " << j.id << '\n';
    out << "Command:  " << j.command << '\n';
    out << "Status:   " << to_string(j.status) << '\n';
    out << "PID:      " << format_pid(j.pid) << '\n';
    out << "Started:  " << format_time(j.start) << '\n';
    if (j.end) out << "Ended:    " << format_time(*j.end) << '\n';
    out << "Duration: " << format_duration(j.duration) << '\n';
    if (j.error) out << "Error:    " << *j.error << '\n';
    out << std::string(80, '=') << '\n';
}

Status do_job(Engine& engine, Invocation& inv) {
    if (inv.args.empty() || inv.args.size() > 2) return usage_error("job id [logs|kill|wait]");
    auto id = parse_job_id(inv.args[0]);
    if (!id) return make_error(ErrorKind::Job, "Invalid job ID: " + inv.args[0]);
    JobManager& jobs = engine.jobs();
    std::string action = inv.args.size() == 2 ? inv.args[1] : "";

    if (action.empty()) {
        auto snap = jobs.get(*id);
        if (!snap) return make_error(ErrorKind::Job, "job " + std::to_string(*id) + " not found");
        print_job_details(inv.out, *snap);
        return std::nullopt;
    }
    if (action == "logs") {
        auto logs = jobs.logs(*id);
        if (!logs) return make_error(ErrorKind::Job, "job " + std::to_string(*id) + " not found");
        if (logs->empty()) inv.out << "No output\n";
        else {
            inv.out << *logs;
            if (logs->back() != '\n') inv.out << '\n';
        }
        return std::nullopt;
    }
    if (action == "kill") {
        if (auto err = jobs.kill(*id)) return err;
        inv.out << "Job " << *id << " killed\n";
        return std::nullopt;
    }
    if (action == "wait") {
        if (!jobs.find(*id)) return make_error(ErrorKind::Job, "job " + std::to_string(*id) + " not found");
        inv.out << "Waiting for job " << *id << "...\n";
        if (auto err = jobs.wait(*id, inv.ctx)) return err;
        inv.out << "Job " << *id << " completed\n";
        return std::nullopt;
    }
    return make_error(ErrorKind::Job, "Unknown action: " + action);
}

Status do_killall(Engine& engine, Invocation& inv) {
    auto errors = engine.jobs().kill_all();
    if (errors.empty()) { inv.out << "All jobs killed\n"; return std::nullopt; }
    std::string msg = "some jobs could not be killed:";
    for (auto& e : errors) msg += "\n  " + e.message;
    return make_error(ErrorKind::Job, msg);
}

Status do_spawn(Engine& engine, Invocation& inv) {
    if (inv.args.empty()) return usage_error("spawn command...");
    std::string line = join_words(inv.args);
    int id = engine.spawn(line, inv.scope);
    inv.out << '[' << id << "] " << line << '\n';
    return std::nullopt;
}

Status do_osexec(Engine& engine, Invocation& inv) {
    std::vector<std::string> argv = inv.args;
    bool background = false;
    if (!argv.empty() && (argv[0] == "--bg" || argv[0] == "-b")) { background = true; argv.erase(argv.begin()); }
    if (argv.empty()) return usage_error("osexec [--bg] program [args...]");

    if (!background) {
        ProcessResult r = run_process(argv, inv.input, inv.ctx, [&inv](const char* data, std::size_t len) {
            inv.out.write(data, static_cast<std::streamsize>(len));
        });
        return r.error;
    }

    std::shared_ptr<const std::string> input;
    if (inv.input) input = std::make_shared<const std::string>(*inv.input);
    int id = engine.jobs().start(join_words(argv), [argv, input](Job& job, const Context& ctx) -> Status {
        bool started = false;
        ProcessResult r = run_process(argv, input.get(), ctx,
            [&job](const char* data, std::size_t len) { job.append_output(std::string(data, len)); },
            [&job, &started](pid_t pid) { started = job.mark_running(pid); return started; });
        if (!started && !r.error) return std::nullopt;
        return r.error;
    });
    inv.out << '[' << id << "] " << join_words(argv) << '\n';
    return std::nullopt;
}

// Joins lines ending in a backslash with the following one.
std::vector<std::pair<std::size_t, std::string>> script_lines(const std::string& content) {
    std::vector<std::pair<std::size_t, std::string>> out;
    std::string pending;
    std::size_t first = 0, lineno = 0;
    for (auto& raw : split_lines(content)) {
        ++lineno;
        if (pending.empty()) first = lineno;
        if (!raw.empty() && raw.back() == '\\') {
            pending += raw.substr(0, raw.size() - 1);
            continue;
        }
        pending += raw;
        out.emplace_back(first, pending);
        pending.clear();
    }
    if (!pending.empty()) out.emplace_back(first, pending);
    return out;
}

Status do_run(Engine& engine, Invocation& inv) {
    if (inv.args.empty()) return usage_error("run file [args...]");
    const std::string& file = inv.args[0];
    std::string content;
    if (auto err = engine.files().read_file(file, content)) return err;

    VariableStore local(inv.scope ? inv.scope->snapshot() : std::vector<VariableStore::Entry>{});
    for (std::size_t i = 0; i < inv.args.size(); ++i) local.set("@arg" + std::to_string(i), inv.args[i]);
    local.set("@argc", std::to_string(inv.args.size() - 1));

    for (auto& entry : script_lines(content)) {
        const std::string& line = entry.second;
        auto b = line.find_first_not_of(" \t");
        if (b == std::string::npos || line[b] == '#') continue;
        ExecResult r = engine.execute_with_context(inv.ctx, line, &local);
        inv.out << r.output;
        if (r.error) {
            Error e = *r.error;
            if (e.kind != ErrorKind::RecursionExceeded && e.kind != ErrorKind::Cancelled)
                e.message = file + ":" + std::to_string(entry.first) + ": " + e.message;
            return e;
        }
    }
    return std::nullopt;
}

} // namespace

void register_job_builtins(Engine& engine) {
    Dispatcher& d = engine.dispatcher();
    d.add("jobs", "List background jobs: jobs [-a] [-v]", [&engine](Invocation& inv){ return do_jobs(engine, inv); });
    d.add("job", "Inspect a job: job id [logs|kill|wait]", [&engine](Invocation& inv){ return do_job(engine, inv); });
    d.add("killall", "Kill every running job", [&engine](Invocation& inv){ return do_killall(engine, inv); });
    d.add("jobclean", "Remove finished jobs", [&engine](Invocation& inv) -> Status {
        std::size_t n = engine.jobs().prune();
        inv.out << "Removed " << n << " completed/failed job(s)\n";
        return std::nullopt;
    });
    d.add("spawn", "Run a command line as a background job", [&engine](Invocation& inv){ return do_spawn(engine, inv); });
    d.add("osexec", "Run an OS program: osexec [--bg] program [args...]",
          [&engine](Invocation& inv){ return do_osexec(engine, inv); });
    d.add("run", "Run a script file; arguments are bound to @arg1..@argN",
          [&engine](Invocation& inv){ return do_run(engine, inv); });
}

} // namespace shellkit
