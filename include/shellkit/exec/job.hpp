/*
 * Background jobs - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   A Job tracks one asynchronous invocation through
 *   pending -> running -> {completed, failed, killed}. Its fields are
 *   guarded by its own mutex; completion is a one-shot event waited on with
 *   a condition variable. JobManager owns the id -> Job registry behind a
 *   reader/writer lock and removes jobs only on an explicit prune.
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>
#include <shellkit/core/context.hpp>
#include <shellkit/core/error.hpp>

namespace shellkit {

enum class JobStatus { Pending, Running, Completed, Failed, Killed };

const char* to_string(JobStatus status);
bool is_terminal(JobStatus status);

struct JobSnapshot {
    int id = 0;
    std::string command;
    JobStatus status = JobStatus::Pending;
    pid_t pid = -1;                                   // -1 when not an OS process
    std::chrono::system_clock::time_point start;
    std::optional<std::chrono::system_clock::time_point> end;
    std::chrono::steady_clock::duration duration{};   // so far, or total once terminal
    std::string output;
    std::optional<std::string> error;
};

class Job : public std::enable_shared_from_this<Job> {
public:
    Job(int id, std::string command);
    ~Job();

    int id() const { return m_id; }
    JobSnapshot snapshot() const;
    JobStatus status() const;
    std::string output() const;
    bool done() const;

    // pending -> running. Returns false when the job was killed first; the
    // caller must then abandon (or terminate) the work it started.
    bool mark_running(pid_t pid = -1);
    void append_output(const std::string& chunk);
    // Terminal transition: killed if a kill was requested, failed if status
    // carries an error, completed otherwise. Fires completion once.
    void finish(const Status& status);

    void set_cancel(CancelFn fn);
    // Invokes the cancellation function. A pending job goes straight to
    // killed. Returns false when the job is already terminal.
    bool request_kill();

    // Blocks until completion or ctx cancellation; true when completed.
    bool wait(const Context& ctx);
    bool wait_for(std::chrono::steady_clock::duration d);

    void attach_worker(std::thread worker);
    // Joins the worker thread unless called from it, in which case it is detached.
    void release_worker();

private:
    void complete_locked(JobStatus status, std::optional<std::string> error);

    const int m_id;
    const std::string m_command;
    const std::chrono::system_clock::time_point m_start;
    const std::chrono::steady_clock::time_point m_start_steady;

    mutable std::mutex m_mu;
    std::condition_variable m_cv;
    JobStatus m_status = JobStatus::Pending;
    pid_t m_pid = -1;
    std::string m_output;
    std::optional<std::string> m_error;
    std::optional<std::chrono::system_clock::time_point> m_end;
    std::chrono::steady_clock::duration m_duration{};
    CancelFn m_cancel;
    bool m_kill_requested = false;
    bool m_done = false;

    std::mutex m_worker_mu;
    std::thread m_worker;
};

// Work run on a job's worker thread with the job's own context.
using JobBody = std::function<Status(Job& job, const Context& ctx)>;

class JobManager {
public:
    explicit JobManager(std::chrono::milliseconds kill_grace = std::chrono::milliseconds(5000));
    ~JobManager();
    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    // Registers a pending job; the caller moves it to running.
    int add(const std::string& command);
    // add + a worker thread running body. Exceptions thrown by body turn
    // into a failed job.
    int start(const std::string& command, JobBody body);

    std::shared_ptr<Job> find(int id) const;
    std::optional<JobSnapshot> get(int id) const;
    std::vector<JobSnapshot> list() const; // id order
    std::size_t size() const;

    Status kill(int id);
    // Terminal error of the job: none when completed.
    Status wait(int id, const Context& ctx = Context::background());
    std::optional<std::string> logs(int id) const;

    std::vector<Error> kill_all();
    // Removes terminal jobs; returns how many were removed.
    std::size_t prune();
    // Cancels outstanding jobs and joins every worker.
    void shutdown();

private:
    mutable std::shared_mutex m_mu;
    std::map<int, std::shared_ptr<Job>> m_jobs;
    int m_next_id = 1;
    std::chrono::milliseconds m_kill_grace;
};

} // namespace shellkit
