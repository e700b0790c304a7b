/*
 * Job manager tests - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <shellkit/exec/job.hpp>
#include <shellkit/exec/engine.hpp>
#include <shellkit/exec/builtins.hpp>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace shellkit;
using namespace std::chrono_literals;

namespace {

// Body that blocks until released or cancelled.
struct Gate {
    std::atomic<bool> open{false};
    JobBody body(const std::string& text) {
        return [this, text](Job& job, const Context& ctx) -> Status {
            if (!job.mark_running()) return std::nullopt;
            while (!open.load()) {
                if (ctx.wait_for(5ms)) return make_error(ErrorKind::Cancelled, "cancelled");
            }
            job.append_output(text);
            return std::nullopt;
        };
    }
};

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds limit = 5000ms) {
    auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

TEST(JobManager, Lifecycle) {
    JobManager jobs;
    Gate gate;
    int id = jobs.start("gated", gate.body("done\n"));
    EXPECT_EQ(id, 1);
    ASSERT_TRUE(wait_until([&]{ return jobs.get(id)->status == JobStatus::Running; }));
    auto snap = jobs.get(id);
    EXPECT_EQ(snap->command, "gated");
    EXPECT_FALSE(snap->end.has_value());

    gate.open = true;
    EXPECT_FALSE(jobs.wait(id));
    snap = jobs.get(id);
    EXPECT_EQ(snap->status, JobStatus::Completed);
    EXPECT_EQ(snap->output, "done\n");
    EXPECT_TRUE(snap->end.has_value());
    EXPECT_FALSE(snap->error.has_value());
    EXPECT_EQ(jobs.logs(id), "done\n");
}

TEST(JobManager, IdsIncrease) {
    JobManager jobs;
    int a = jobs.add("a");
    int b = jobs.add("b");
    EXPECT_EQ(b, a + 1);
    auto all = jobs.list();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, a);
    EXPECT_EQ(all[0].status, JobStatus::Pending);
}

TEST(JobManager, FailureIsCaptured) {
    JobManager jobs;
    int id = jobs.start("fails", [](Job& job, const Context&) -> Status {
        job.mark_running();
        job.append_output("partial\n");
        return make_error(ErrorKind::Dispatch, "unknown command: nope");
    });
    auto err = jobs.wait(id);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, ErrorKind::Job);
    EXPECT_EQ(err->message, "job " + std::to_string(id) + " failed: unknown command: nope");
    auto snap = jobs.get(id);
    EXPECT_EQ(snap->status, JobStatus::Failed);
    EXPECT_EQ(snap->output, "partial\n");
}

TEST(JobManager, ExceptionBecomesFailure) {
    JobManager jobs;
    int id = jobs.start("throws", [](Job&, const Context&) -> Status {
        throw std::runtime_error("boom");
    });
    auto err = jobs.wait(id);
    ASSERT_TRUE(err);
    auto snap = jobs.get(id);
    EXPECT_EQ(snap->status, JobStatus::Failed);
    EXPECT_EQ(snap->error, "panic: boom");
}

TEST(JobManager, KillRunningJob) {
    JobManager jobs(2000ms);
    Gate gate;
    int id = jobs.start("forever", gate.body("never"));
    ASSERT_TRUE(wait_until([&]{ return jobs.get(id)->status == JobStatus::Running; }));
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(jobs.kill(id));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1500ms);
    EXPECT_EQ(jobs.get(id)->status, JobStatus::Killed);

    auto err = jobs.kill(id);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->message, "job " + std::to_string(id) + " is not running (status: killed)");
    err = jobs.wait(id);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->message, "job " + std::to_string(id) + " was killed");
}

TEST(JobManager, KillPendingJob) {
    JobManager jobs;
    int id = jobs.add("never started");
    EXPECT_FALSE(jobs.kill(id));
    EXPECT_EQ(jobs.get(id)->status, JobStatus::Killed);
    // a late start attempt is refused
    EXPECT_FALSE(jobs.find(id)->mark_running());
}

TEST(JobManager, UnknownJob) {
    JobManager jobs;
    auto err = jobs.kill(42);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->message, "job 42 not found");
    EXPECT_EQ(jobs.wait(42)->message, "job 42 not found");
    EXPECT_FALSE(jobs.get(42).has_value());
    EXPECT_FALSE(jobs.logs(42).has_value());
}

TEST(JobManager, WaitReturnsPromptly) {
    JobManager jobs;
    int id = jobs.start("short", [](Job& job, const Context& ctx) -> Status {
        job.mark_running();
        ctx.wait_for(100ms);
        return std::nullopt;
    });
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(jobs.wait(id));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1000ms);
}

TEST(JobManager, ConcurrentWaitersReleaseTogether) {
    JobManager jobs;
    Gate gate;
    int id = jobs.start("gated", gate.body("done\n"));
    ASSERT_TRUE(wait_until([&]{ return jobs.get(id)->status == JobStatus::Running; }));

    constexpr int kWaiters = 4;
    std::atomic<int> returned{0};
    std::atomic<int> failures{0};
    std::vector<std::chrono::steady_clock::time_point> finished(kWaiters);
    std::vector<std::thread> waiters;
    for (int i = 0; i < kWaiters; ++i) {
        waiters.emplace_back([&, i] {
            if (jobs.wait(id)) ++failures;
            finished[i] = std::chrono::steady_clock::now();
            ++returned;
        });
    }
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(returned.load(), 0);

    auto opened = std::chrono::steady_clock::now();
    gate.open = true;
    for (auto& t : waiters) t.join();
    EXPECT_EQ(failures.load(), 0);
    for (auto& at : finished) {
        EXPECT_GE(at, opened);
        EXPECT_LT(at - opened, 500ms);
    }
    EXPECT_EQ(jobs.get(id)->status, JobStatus::Completed);
}

TEST(JobManager, WaitHonoursCallerContext) {
    JobManager jobs;
    Gate gate;
    int id = jobs.start("forever", gate.body(""));
    auto pair = Context::with_timeout(Context::background(), 100ms);
    auto t0 = std::chrono::steady_clock::now();
    auto err = jobs.wait(id, pair.first);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2000ms);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, ErrorKind::Cancelled);
    EXPECT_EQ(err->message, "wait for job " + std::to_string(id) + " cancelled: deadline exceeded");
    // the job itself keeps running
    EXPECT_FALSE(jobs.get(id)->end.has_value());
    gate.open = true;
    EXPECT_FALSE(jobs.wait(id));
}

TEST(JobManager, KillAllAndPrune) {
    JobManager jobs(2000ms);
    Gate gate;
    int a = jobs.start("a", gate.body(""));
    int b = jobs.start("b", gate.body(""));
    int c = jobs.start("c", [](Job& job, const Context&) -> Status { job.mark_running(); return std::nullopt; });
    EXPECT_FALSE(jobs.wait(c));
    EXPECT_TRUE(jobs.kill_all().empty());
    EXPECT_EQ(jobs.get(a)->status, JobStatus::Killed);
    EXPECT_EQ(jobs.get(b)->status, JobStatus::Killed);
    EXPECT_EQ(jobs.get(c)->status, JobStatus::Completed);
    EXPECT_EQ(jobs.prune(), 3u);
    EXPECT_EQ(jobs.size(), 0u);
}

TEST(JobManager, ShutdownStopsWorkers) {
    Gate gate;
    auto t0 = std::chrono::steady_clock::now();
    {
        JobManager jobs;
        jobs.start("a", gate.body(""));
        jobs.start("b", gate.body(""));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 3000ms);
}

TEST(JobManager, ConcurrentReaders) {
    JobManager jobs;
    Gate gate;
    for (int i = 0; i < 4; ++i) jobs.start("job" + std::to_string(i), gate.body("x"));
    std::vector<std::thread> readers;
    std::atomic<int> seen{0};
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]{
            for (int i = 0; i < 200; ++i) {
                seen += static_cast<int>(jobs.list().size());
                (void)jobs.get(1);
            }
        });
    }
    for (auto& r : readers) r.join();
    EXPECT_EQ(seen.load(), 4 * 200 * 4);
    gate.open = true;
    for (int id = 1; id <= 4; ++id) EXPECT_FALSE(jobs.wait(id));
}

// ---- job verbs through the engine ----

class JobCommandsTest : public ::testing::Test {
protected:
    JobCommandsTest() { register_builtins(engine); }

    std::string run(const std::string& line) {
        auto r = engine.execute(line);
        EXPECT_TRUE(r.ok()) << line << ": " << (r.error ? r.error->message : "");
        return r.output;
    }

    Engine engine;
};

TEST_F(JobCommandsTest, SpawnWaitLogs) {
    EXPECT_EQ(run("jobs"), "No jobs\n");
    EXPECT_EQ(run("spawn print hi"), "[1] print hi\n");
    EXPECT_EQ(run("job 1 wait"), "Waiting for job 1...\nJob 1 completed\n");
    EXPECT_EQ(run("job 1 logs"), "hi\n");
    EXPECT_EQ(run("jobs"), "No running jobs\n");
    std::string all = run("jobs -a");
    EXPECT_NE(all.find("[1] [completed] PID:-"), std::string::npos);
    EXPECT_NE(all.find("    print hi\n"), std::string::npos);
    std::string details = run("job 1");
    EXPECT_NE(details.find("Job ID:   1\n"), std::string::npos);
    EXPECT_NE(details.find("Status:   completed\n"), std::string::npos);
    EXPECT_NE(details.find("Ended:"), std::string::npos);
    EXPECT_EQ(run("jobclean"), "Removed 1 completed/failed job(s)\n");
    EXPECT_EQ(run("jobs -a"), "No jobs\n");
}

TEST_F(JobCommandsTest, FailedSpawnSurfacesOnWait) {
    run("spawn nosuch");
    auto r = engine.execute("job 1 wait");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->message, "job 1 failed: unknown command: nosuch");
    EXPECT_EQ(run("job 1 logs"), "No output\n");
}

TEST_F(JobCommandsTest, InvalidArguments) {
    auto r = engine.execute("job abc");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->message, "Invalid job ID: abc");
    r = engine.execute("job 99");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->message, "job 99 not found");
    run("spawn print x");
    r = engine.execute("job 1 frob");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->message, "Unknown action: frob");
}

TEST_F(JobCommandsTest, KillBackgroundSleep) {
    EXPECT_EQ(run("sleep 30 &"), "[1] sleep 30\n");
    ASSERT_TRUE(wait_until([&]{ return engine.jobs().get(1)->status == JobStatus::Running; }));
    std::string listing = run("jobs");
    EXPECT_NE(listing.find("[1] [running]"), std::string::npos);
    EXPECT_EQ(run("job 1 kill"), "Job 1 killed\n");
    EXPECT_EQ(engine.jobs().get(1)->status, JobStatus::Killed);
    EXPECT_EQ(run("killall"), "All jobs killed\n");
}

TEST_F(JobCommandsTest, RunningJobsDoNotConsumeDepth) {
    const int count = engine.config().max_exec_depth + 2;
    for (int i = 0; i < count; ++i) run("spawn sleep 30");
    ASSERT_TRUE(wait_until([&]{
        for (auto& snap : engine.jobs().list())
            if (snap.status != JobStatus::Running) return false;
        return true;
    }));
    EXPECT_EQ(engine.current_depth(), 0);
    EXPECT_EQ(run("print hi"), "hi\n");
    EXPECT_EQ(run("killall"), "All jobs killed\n");
    for (auto& snap : engine.jobs().list()) EXPECT_EQ(snap.status, JobStatus::Killed);
}

TEST_F(JobCommandsTest, SpawnedRecursionIsStillBounded) {
    engine.aliases().set("loop", "@exec:loop");
    run("spawn loop");
    auto err = engine.jobs().wait(1);
    ASSERT_TRUE(err);
    EXPECT_NE(err->message.find("maximum execution depth exceeded"), std::string::npos);
    EXPECT_EQ(engine.current_depth(), 0);
}

TEST_F(JobCommandsTest, OsexecBackgroundProcess) {
    EXPECT_EQ(run("osexec --bg /bin/sleep 30"), "[1] /bin/sleep 30\n");
    ASSERT_TRUE(wait_until([&]{ return engine.jobs().get(1)->pid > 0; }));
    EXPECT_EQ(engine.jobs().get(1)->status, JobStatus::Running);
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(run("job 1 kill"), "Job 1 killed\n");
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 3000ms);
    EXPECT_EQ(engine.jobs().get(1)->status, JobStatus::Killed);
}

TEST_F(JobCommandsTest, OsexecBackgroundOutput) {
    run("osexec --bg /bin/echo from process");
    EXPECT_FALSE(engine.jobs().wait(1));
    EXPECT_EQ(engine.jobs().logs(1), "from process\n");
    EXPECT_GT(engine.jobs().get(1)->pid, 0);
}
