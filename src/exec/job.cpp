/*
 * Background jobs implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/exec/job.hpp>
#include <shellkit/core/log.hpp>
#include <atomic>
#include <exception>

namespace shellkit {

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Running: return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Killed: return "killed";
    }
    return "unknown";
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed || status == JobStatus::Killed;
}

Job::Job(int id, std::string command)
    : m_id(id), m_command(std::move(command)),
      m_start(std::chrono::system_clock::now()), m_start_steady(std::chrono::steady_clock::now()) {}

Job::~Job() {
    if (m_worker.joinable()) m_worker.detach();
}

JobSnapshot Job::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mu);
    JobSnapshot s;
    s.id = m_id; s.command = m_command; s.status = m_status; s.pid = m_pid;
    s.start = m_start; s.end = m_end; s.output = m_output; s.error = m_error;
    s.duration = m_done ? m_duration : std::chrono::steady_clock::now() - m_start_steady;
    return s;
}

JobStatus Job::status() const { std::lock_guard<std::mutex> lock(m_mu); return m_status; }
std::string Job::output() const { std::lock_guard<std::mutex> lock(m_mu); return m_output; }
bool Job::done() const { std::lock_guard<std::mutex> lock(m_mu); return m_done; }

bool Job::mark_running(pid_t pid) {
    std::lock_guard<std::mutex> lock(m_mu);
    if (m_done || m_kill_requested) return false;
    m_status = JobStatus::Running;
    m_pid = pid;
    log_debug("job " + std::to_string(m_id) + " running" + (pid > 0 ? " (pid " + std::to_string(pid) + ")" : ""));
    return true;
}

void Job::append_output(const std::string& chunk) {
    std::lock_guard<std::mutex> lock(m_mu);
    m_output += chunk;
}

void Job::complete_locked(JobStatus status, std::optional<std::string> error) {
    m_status = status;
    m_error = std::move(error);
    m_end = std::chrono::system_clock::now();
    m_duration = std::chrono::steady_clock::now() - m_start_steady;
    m_cancel = nullptr;
    m_done = true;
    m_cv.notify_all();
}

void Job::finish(const Status& status) {
    std::lock_guard<std::mutex> lock(m_mu);
    if (m_done) return;
    if (m_kill_requested) complete_locked(JobStatus::Killed, std::string("killed"));
    else if (status) complete_locked(JobStatus::Failed, status->message);
    else complete_locked(JobStatus::Completed, std::nullopt);
    if (m_status == JobStatus::Failed) log_info("job " + std::to_string(m_id) + " failed: " + *m_error);
    else log_debug("job " + std::to_string(m_id) + " " + to_string(m_status));
}

void Job::set_cancel(CancelFn fn) {
    std::lock_guard<std::mutex> lock(m_mu);
    if (!m_done) m_cancel = std::move(fn);
}

bool Job::request_kill() {
    CancelFn cancel;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        if (m_done) return false;
        m_kill_requested = true;
        cancel = m_cancel;
        if (m_status == JobStatus::Pending) complete_locked(JobStatus::Killed, std::string("killed"));
    }
    if (cancel) cancel();
    return true;
}

bool Job::wait(const Context& ctx) {
    auto woken = std::make_shared<std::atomic<bool>>(false);
    std::weak_ptr<Job> weak = weak_from_this();
    auto reg = ctx.on_cancel([weak, woken]{
        woken->store(true);
        if (auto self = weak.lock()) {
            { std::lock_guard<std::mutex> lock(self->m_mu); }
            self->m_cv.notify_all();
        }
    });
    auto deadline = ctx.deadline();
    std::unique_lock<std::mutex> lock(m_mu);
    auto ready = [&]{ return m_done || woken->load(); };
    if (deadline) m_cv.wait_until(lock, *deadline, ready);
    else m_cv.wait(lock, ready);
    return m_done;
}

bool Job::wait_for(std::chrono::steady_clock::duration d) {
    std::unique_lock<std::mutex> lock(m_mu);
    return m_cv.wait_for(lock, d, [&]{ return m_done; });
}

void Job::attach_worker(std::thread worker) {
    std::lock_guard<std::mutex> lock(m_worker_mu);
    m_worker = std::move(worker);
}

void Job::release_worker() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lock(m_worker_mu);
        t = std::move(m_worker);
    }
    if (!t.joinable()) return;
    if (t.get_id() == std::this_thread::get_id()) t.detach();
    else t.join();
}

JobManager::JobManager(std::chrono::milliseconds kill_grace) : m_kill_grace(kill_grace) {}

JobManager::~JobManager() { shutdown(); }

int JobManager::add(const std::string& command) {
    std::unique_lock<std::shared_mutex> lock(m_mu);
    int id = m_next_id++;
    m_jobs.emplace(id, std::make_shared<Job>(id, command));
    return id;
}

int JobManager::start(const std::string& command, JobBody body) {
    int id = add(command);
    auto job = find(id);
    auto cancellable = Context::with_cancel(Context::background());
    Context ctx = cancellable.first;
    job->set_cancel(cancellable.second);
    std::thread worker([job, ctx, body]{
        Status st;
        try {
            st = body(*job, ctx);
        } catch (const std::exception& e) {
            st = make_error(ErrorKind::Job, std::string("panic: ") + e.what());
        } catch (...) {
            st = make_error(ErrorKind::Job, "panic: unknown exception");
        }
        job->finish(st);
    });
    job->attach_worker(std::move(worker));
    return id;
}

std::shared_ptr<Job> JobManager::find(int id) const {
    std::shared_lock<std::shared_mutex> lock(m_mu);
    auto it = m_jobs.find(id);
    return it == m_jobs.end() ? nullptr : it->second;
}

std::optional<JobSnapshot> JobManager::get(int id) const {
    auto job = find(id);
    if (!job) return std::nullopt;
    return job->snapshot();
}

std::vector<JobSnapshot> JobManager::list() const {
    std::vector<std::shared_ptr<Job>> jobs;
    {
        std::shared_lock<std::shared_mutex> lock(m_mu);
        for (auto& kv : m_jobs) jobs.push_back(kv.second);
    }
    std::vector<JobSnapshot> out;
    out.reserve(jobs.size());
    for (auto& j : jobs) out.push_back(j->snapshot());
    return out;
}

std::size_t JobManager::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mu);
    return m_jobs.size();
}

Status JobManager::kill(int id) {
    auto job = find(id);
    if (!job) return make_error(ErrorKind::Job, "job " + std::to_string(id) + " not found");
    JobStatus before = job->status();
    if (!job->request_kill())
        return make_error(ErrorKind::Job, "job " + std::to_string(id) + " is not running (status: " + to_string(before) + ")");
    if (!job->wait_for(m_kill_grace))
        log_warn("job " + std::to_string(id) + " did not stop within " + std::to_string(m_kill_grace.count()) + "ms");
    return std::nullopt;
}

Status JobManager::wait(int id, const Context& ctx) {
    auto job = find(id);
    if (!job) return make_error(ErrorKind::Job, "job " + std::to_string(id) + " not found");
    if (!job->wait(ctx)) {
        std::string why = ctx.reason();
        return make_error(ErrorKind::Cancelled, "wait for job " + std::to_string(id) + " cancelled: " + (why.empty() ? "cancelled" : why));
    }
    JobSnapshot s = job->snapshot();
    if (s.status == JobStatus::Completed) return std::nullopt;
    if (s.status == JobStatus::Killed) return make_error(ErrorKind::Job, "job " + std::to_string(id) + " was killed");
    return make_error(ErrorKind::Job, "job " + std::to_string(id) + " failed: " + s.error.value_or("unknown error"));
}

std::optional<std::string> JobManager::logs(int id) const {
    auto job = find(id);
    if (!job) return std::nullopt;
    return job->output();
}

std::vector<Error> JobManager::kill_all() {
    std::vector<Error> errors;
    for (auto& s : list()) {
        if (is_terminal(s.status)) continue;
        if (auto err = kill(s.id)) errors.push_back(*err);
    }
    return errors;
}

std::size_t JobManager::prune() {
    std::vector<std::shared_ptr<Job>> removed;
    {
        std::unique_lock<std::shared_mutex> lock(m_mu);
        for (auto it = m_jobs.begin(); it != m_jobs.end();) {
            if (it->second->done()) { removed.push_back(it->second); it = m_jobs.erase(it); }
            else ++it;
        }
    }
    for (auto& j : removed) j->release_worker();
    return removed.size();
}

void JobManager::shutdown() {
    std::vector<std::shared_ptr<Job>> jobs;
    {
        std::shared_lock<std::shared_mutex> lock(m_mu);
        for (auto& kv : m_jobs) jobs.push_back(kv.second);
    }
    for (auto& j : jobs) if (!j->done()) j->request_kill();
    for (auto& j : jobs) j->release_worker();
}

} // namespace shellkit
