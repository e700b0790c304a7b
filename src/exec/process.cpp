/*
 * OS process execution implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/exec/process.hpp>
#include <shellkit/exec/path.hpp>
#include <shellkit/core/log.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <thread>
#include <time.h>
#include <unistd.h>

namespace shellkit {

static Error sys_error(const std::string& what) {
    return make_error(ErrorKind::Dispatch, what + ": " + std::strerror(errno));
}

static void close_fd(int& fd) { if (fd >= 0) { ::close(fd); fd = -1; } }

// Feeds stdin on its own thread so a child that writes before reading
// cannot deadlock against us. SIGPIPE is blocked here: a child exiting
// early shows up as EPIPE.
static void feed_input(int fd, std::string data) {
    sigset_t set; sigemptyset(&set); sigaddset(&set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) { if (errno == EINTR) continue; break; }
        off += static_cast<std::size_t>(n);
    }
    ::close(fd);
    struct timespec zero{0, 0};
    sigtimedwait(&set, nullptr, &zero); // drop a pending SIGPIPE
}

ProcessResult run_process(const std::vector<std::string>& argv, const std::string* input, const Context& ctx,
                          const OutputFn& on_output, const StartFn& on_start) {
    ProcessResult res;
    if (argv.empty()) { res.error = make_error(ErrorKind::Dispatch, "missing program"); return res; }
    auto exe = resolve_executable(argv[0]);
    if (!exe) { res.exit_code = 127; res.error = make_error(ErrorKind::Dispatch, argv[0] + ": command not found"); return res; }
    if (ctx.cancelled()) { res.error = make_error(ErrorKind::Cancelled, argv[0] + ": cancelled before start"); return res; }

    std::vector<char*> cargv; cargv.reserve(argv.size() + 1);
    for (auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    if (::pipe(out_pipe) != 0) { res.error = sys_error("pipe"); return res; }
    if (input && ::pipe(in_pipe) != 0) {
        res.error = sys_error("pipe");
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        return res;
    }
    ::fcntl(out_pipe[0], F_SETFD, FD_CLOEXEC);
    if (input) ::fcntl(in_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        res.error = sys_error("fork");
        close_fd(out_pipe[0]); close_fd(out_pipe[1]); close_fd(in_pipe[0]); close_fd(in_pipe[1]);
        return res;
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        std::signal(SIGPIPE, SIG_DFL);
        std::signal(SIGINT, SIG_DFL);
        if (input) { ::dup2(in_pipe[0], STDIN_FILENO); }
        else { int devnull = ::open("/dev/null", O_RDONLY); if (devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); } }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        if (in_pipe[0] >= 0) ::close(in_pipe[0]);
        if (in_pipe[1] >= 0) ::close(in_pipe[1]);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::execv(exe->c_str(), cargv.data());
        _exit(127);
    }
    ::setpgid(pid, pid); // also done by the child; whichever runs first wins
    res.pid = pid;
    close_fd(out_pipe[1]);
    close_fd(in_pipe[0]);

    bool aborted = on_start && !on_start(pid);
    if (aborted) ::kill(-pid, SIGTERM);
    auto reg = ctx.on_cancel([pid]{ ::kill(-pid, SIGTERM); });

    std::thread writer;
    if (input) { writer = std::thread(feed_input, in_pipe[1], *input); in_pipe[1] = -1; }

    char buf[4096];
    bool deadline_hit = false;
    while (true) {
        int timeout_ms = -1;
        if (!deadline_hit) {
            if (auto dl = ctx.deadline()) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*dl - Context::Clock::now()).count() + 1;
                timeout_ms = left < 0 ? 0 : static_cast<int>(left);
            }
        }
        struct pollfd pfd{out_pipe[0], POLLIN, 0};
        int pr = ::poll(&pfd, 1, timeout_ms);
        if (pr < 0) { if (errno == EINTR) continue; log_warn(std::string("poll: ") + std::strerror(errno)); break; }
        if (pr == 0) {
            // deadline reached: cancelled() fires the group kill registered above
            if (ctx.cancelled()) deadline_hit = true;
            continue;
        }
        ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
        if (n < 0) { if (errno == EINTR) continue; break; }
        if (n == 0) break;
        if (on_output) on_output(buf, static_cast<std::size_t>(n));
    }
    close_fd(out_pipe[0]);
    reg.reset();

    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    if (writer.joinable()) writer.join();

    if (WIFEXITED(st)) res.exit_code = WEXITSTATUS(st);
    else if (WIFSIGNALED(st)) res.exit_code = 128 + WTERMSIG(st);

    if (aborted || ctx.cancelled()) {
        std::string why = ctx.reason();
        res.error = make_error(ErrorKind::Cancelled, argv[0] + ": " + (why.empty() ? std::string("cancelled") : why));
    } else if (res.exit_code != 0) {
        res.error = make_error(ErrorKind::Dispatch, argv[0] + ": exit status " + std::to_string(res.exit_code));
    }
    return res;
}

} // namespace shellkit
