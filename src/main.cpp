/*
 * shellkit-run - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Command-line front end for the engine: runs a single line (-c), a
 *   script (-f), or reads lines from stdin. Ctrl-C cancels the line in
 *   progress instead of terminating the process.
 */
#include <shellkit/exec/engine.hpp>
#include <shellkit/exec/builtins.hpp>
#include <shellkit/core/log.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace shellkit;

static volatile sig_atomic_t g_interrupted = 0;
static void sigint_handler(int) { g_interrupted = 1; }

namespace {

// Forwards SIGINT to the cancel function of the line being executed.
class InterruptWatcher {
public:
    InterruptWatcher() : m_thread([this]{ loop(); }) {}
    ~InterruptWatcher() { m_stop = true; m_thread.join(); }

    void arm(CancelFn fn) { std::lock_guard<std::mutex> lk(m_mu); m_cancel = std::move(fn); }
    void disarm() { std::lock_guard<std::mutex> lk(m_mu); m_cancel = nullptr; }

private:
    void loop() {
        while (!m_stop) {
            if (g_interrupted) {
                g_interrupted = 0;
                std::lock_guard<std::mutex> lk(m_mu);
                if (m_cancel) m_cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    std::atomic<bool> m_stop{false};
    std::mutex m_mu;
    CancelFn m_cancel;
    std::thread m_thread;
};

void usage() {
    std::cerr << "Usage: shellkit-run [-c line] [-f file] [--config path] [-d]\n"
                 "  -c line        execute one line and exit\n"
                 "  -f file        execute a script file (same as 'run file')\n"
                 "  --config path  configuration file (default ~/.shellkitrc)\n"
                 "  -d             debug logging\n";
}

int run_line(Engine& engine, InterruptWatcher& watcher, const std::string& line) {
    auto pair = Context::with_cancel(Context::background());
    watcher.arm(pair.second);
    ExecResult r = engine.execute_with_context(pair.first, line);
    watcher.disarm();
    pair.second();
    std::cout << r.output;
    std::cout.flush();
    if (r.error) {
        std::cerr << r.error->message << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string command, script, config_path = default_config_path();
    bool debug = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& dst) {
            if (i + 1 >= argc) { std::cerr << a << " requires an argument\n"; return false; }
            dst = argv[++i];
            return true;
        };
        if (a == "-c") { if (!next(command)) return 2; }
        else if (a == "-f") { if (!next(script)) return 2; }
        else if (a == "--config") { if (!next(config_path)) return 2; }
        else if (a == "-d" || a == "--debug") debug = true;
        else if (a == "-h" || a == "--help") { usage(); return 0; }
        else { std::cerr << "unknown option: " << a << "\n"; usage(); return 2; }
    }

    EngineConfig cfg;
    if (!config_path.empty() && !load_config(config_path, cfg))
        log_debug("no configuration file at " + config_path);
    apply_env_overrides(cfg);
    if (debug) cfg.log_level = LogLevel::Debug;
    set_log_level(cfg.log_level);

    std::signal(SIGINT, sigint_handler);

    Engine engine(cfg);
    register_builtins(engine);
    if (auto err = engine.load_aliases()) log_debug(err->message);

    InterruptWatcher watcher;
    if (!command.empty()) return run_line(engine, watcher, command);
    if (!script.empty()) return run_line(engine, watcher, "run " + quote_word(script));

    const bool interactive = isatty(STDIN_FILENO);
    if (interactive) std::cout << cfg.app_name << " - type 'help' for commands, 'exit' to quit.\n";
    int last_status = 0;
    std::string line;
    while (true) {
        if (interactive) { std::cout << cfg.app_name << "> "; std::cout.flush(); }
        if (!std::getline(std::cin, line)) break;
        auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos) continue;
        std::string t = line.substr(b);
        if (t == "exit" || t == "quit") break;
        last_status = run_line(engine, watcher, line);
    }
    if (interactive) std::cout << "\n";
    return last_status;
}
