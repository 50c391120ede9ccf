#include <gtest/gtest.h>
#include <managers/job_queue.hpp>
#include "test_support.hpp"

namespace {

using Outcome = JobQueue::DispatchOutcome;

struct QueueFixture {
    TempDb tmp;
    FakeClock clock;
    FakeFleet fleet;
    std::shared_ptr<FakeAgent> agent = fleet.add("nas");
    TimingConfig timings;
    Database db{tmp.path};
    JobStore jobs{db, clock.fn()};
    std::unique_ptr<NodeRegistry> registry;
    std::unique_ptr<JobQueue> queue;
    std::vector<Job> dispatched;
    std::vector<Job> terminal;

    explicit QueueFixture(int max_concurrent = 1, int max_queue_depth = 8) {
        timings.dispatch_max_attempts = 3;
        timings.dispatch_backoff_ms = 10;
        timings.promote_after_secs = 60;
        registry = std::make_unique<NodeRegistry>(
            std::vector<NodeConfig>{test_node("nas", max_concurrent, max_queue_depth)},
            fleet.factory());
        queue = std::make_unique<JobQueue>(jobs, *registry, timings, clock.fn());
        queue->set_on_dispatched([this](const Job& j) { dispatched.push_back(j); });
        queue->set_on_terminal([this](const Job& j) { terminal.push_back(j); });
    }

    std::string add(const std::string& uid, JobKind kind = JobKind::Copy) {
        Job j;
        j.uid = uid;
        j.node = "nas";
        j.kind = kind;
        j.src = "local:/" + uid;
        j.dst = "b2:" + uid;
        jobs.insert(j);
        return uid;
    }

    JobStatus status(const std::string& uid) { return jobs.get(uid)->status; }
};

} // namespace

TEST(JobQueue, SecondJobWaitsForSlot) {
    QueueFixture f(1);
    ASSERT_TRUE(f.queue->admit(f.add("j1"), JobStatus::Pending).is_ok());
    ASSERT_TRUE(f.queue->admit(f.add("j2"), JobStatus::Pending).is_ok());

    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Dispatched);
    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Idle);
    EXPECT_EQ(f.status("j1"), JobStatus::Running);
    EXPECT_EQ(f.status("j2"), JobStatus::Queued);
    EXPECT_EQ(f.queue->running_count("nas"), 1u);
    EXPECT_EQ(f.agent->real_starts(), 1);

    // j1 finishes; its slot goes to j2.
    f.queue->release("nas", "j1");
    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Dispatched);
    EXPECT_EQ(f.status("j2"), JobStatus::Running);
    EXPECT_EQ(f.agent->real_starts(), 2);
    ASSERT_EQ(f.dispatched.size(), 2u);
    EXPECT_EQ(f.dispatched[1].uid, "j2");
    EXPECT_TRUE(f.dispatched[1].agent_job_id.has_value());
}

TEST(JobQueue, RespectsMaxConcurrent) {
    QueueFixture f(2);
    for (const char* id : {"a", "b", "c"}) {
        ASSERT_TRUE(f.queue->admit(f.add(id), JobStatus::Pending).is_ok());
    }
    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Dispatched);
    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Dispatched);
    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Idle);
    EXPECT_EQ(f.queue->running_count("nas"), 2u);
    EXPECT_EQ(f.queue->queued_count("nas"), 1u);
}

TEST(JobQueue, QueueFullRejectsWithoutSideEffect) {
    QueueFixture f(1, 2);
    ASSERT_TRUE(f.queue->admit(f.add("a"), JobStatus::Pending).is_ok());
    ASSERT_TRUE(f.queue->admit(f.add("b"), JobStatus::Pending).is_ok());

    auto r = f.queue->admit(f.add("c"), JobStatus::Pending);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::QueueFull);
    EXPECT_EQ(f.status("c"), JobStatus::Pending);
    EXPECT_EQ(f.queue->queued_count("nas"), 2u);
}

TEST(JobQueue, GateFailureLeavesJobUntouched) {
    QueueFixture f;
    f.add("s1", JobKind::Sync);
    f.jobs.transition("s1", {JobStatus::Pending}, JobStatus::DryRunPending);

    auto r = f.queue->admit("s1", JobStatus::DryRunPending, [](Job&) {
        return Result<void>::Err(ErrorKind::InvalidDryRunToken, "plan expired");
    });
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidDryRunToken);
    EXPECT_EQ(f.status("s1"), JobStatus::DryRunPending);
    EXPECT_EQ(f.queue->queued_count("nas"), 0u);
}

TEST(JobQueue, GateSuppliesToken) {
    QueueFixture f;
    f.add("s1", JobKind::Sync);
    f.jobs.transition("s1", {JobStatus::Pending}, JobStatus::DryRunPending);

    auto r = f.queue->admit("s1", JobStatus::DryRunPending, [](Job& j) {
        j.dry_run_token = "tok";
        return Result<void>::Ok();
    });
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(f.jobs.get("s1")->dry_run_token, "tok");
}

TEST(JobQueue, DestructiveWithoutTokenNotAdmitted) {
    QueueFixture f;
    f.add("s1", JobKind::Sync);
    auto r = f.queue->admit("s1", JobStatus::Pending);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(f.queue->queued_count("nas"), 0u);
    EXPECT_EQ(f.agent->real_starts(), 0);
}

TEST(JobQueue, RetriesThenFailsUnreachable) {
    QueueFixture f;
    f.agent->set_unreachable(true);
    ASSERT_TRUE(f.queue->admit(f.add("j1"), JobStatus::Pending).is_ok());

    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Retry);
    EXPECT_EQ(f.status("j1"), JobStatus::Queued);
    EXPECT_EQ(f.queue->running_count("nas"), 0u);
    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Retry);
    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Failed);

    auto job = f.jobs.get("j1");
    EXPECT_EQ(job->status, JobStatus::Failed);
    EXPECT_EQ(job->dispatch_attempts, 3);
    EXPECT_EQ(job->error.rfind(REASON_AGENT_UNREACHABLE, 0), 0u);
    EXPECT_EQ(f.queue->dispatch_failures(), 3u);
    EXPECT_EQ(f.queue->running_count("nas"), 0u);
    ASSERT_EQ(f.terminal.size(), 1u);
    EXPECT_EQ(f.terminal[0].uid, "j1");
}

TEST(JobQueue, RecoversAfterTransientFailure) {
    QueueFixture f;
    f.agent->fail_starts = 1;
    ASSERT_TRUE(f.queue->admit(f.add("j1"), JobStatus::Pending).is_ok());

    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Retry);
    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Dispatched);
    auto job = f.jobs.get("j1");
    EXPECT_EQ(job->status, JobStatus::Running);
    EXPECT_EQ(job->dispatch_attempts, 2);
}

TEST(JobQueue, RejectedStartFailsImmediately) {
    QueueFixture f;
    f.agent->fail_starts = 1;
    f.agent->start_error = ErrorKind::AgentRejected;
    ASSERT_TRUE(f.queue->admit(f.add("j1"), JobStatus::Pending).is_ok());

    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Failed);
    EXPECT_EQ(f.status("j1"), JobStatus::Failed);
}

TEST(JobQueue, StoppedWhileQueuedIsSkipped) {
    QueueFixture f;
    ASSERT_TRUE(f.queue->admit(f.add("j1"), JobStatus::Pending).is_ok());
    ASSERT_TRUE(f.jobs.transition("j1", {JobStatus::Queued}, JobStatus::Stopped).is_ok());

    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Skipped);
    EXPECT_EQ(f.queue->running_count("nas"), 0u);
    EXPECT_EQ(f.agent->real_starts(), 0);
}

TEST(JobQueue, RemoveDropsEntry) {
    QueueFixture f;
    ASSERT_TRUE(f.queue->admit(f.add("j1"), JobStatus::Pending).is_ok());
    EXPECT_TRUE(f.queue->remove("nas", "j1"));
    EXPECT_FALSE(f.queue->remove("nas", "j1"));
    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Idle);
}

TEST(JobQueue, StorageFailureAfterStartReturnsSlot) {
    QueueFixture f(1);
    ASSERT_TRUE(f.queue->admit(f.add("j1"), JobStatus::Pending).is_ok());

    // Refuse the queued -> running write.
    f.db.exec("CREATE TEMP TRIGGER refuse_running BEFORE UPDATE ON jobs "
              "WHEN NEW.status = 'running' BEGIN SELECT RAISE(ABORT, 'disk I/O error'); END;");
    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Retry);

    EXPECT_EQ(f.status("j1"), JobStatus::Queued);
    EXPECT_EQ(f.queue->running_count("nas"), 0u);
    EXPECT_EQ(f.queue->queued_count("nas"), 1u);
    EXPECT_EQ(f.queue->dispatch_failures(), 1u);
    ASSERT_EQ(f.agent->stops.size(), 1u);
    EXPECT_EQ(f.agent->stops[0], f.agent->last_id());
    EXPECT_TRUE(f.dispatched.empty());

    f.db.exec("DROP TRIGGER refuse_running;");
    EXPECT_EQ(f.queue->dispatch_next("nas"), Outcome::Dispatched);
    EXPECT_EQ(f.status("j1"), JobStatus::Running);
    EXPECT_EQ(f.queue->running_count("nas"), 1u);
}

TEST(JobQueue, WorkersDispatchInBackground) {
    QueueFixture f;
    f.queue->start();
    ASSERT_TRUE(f.queue->admit(f.add("j1"), JobStatus::Pending).is_ok());

    for (int i = 0; i < 200 && f.status("j1") != JobStatus::Running; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    f.queue->stop();
    EXPECT_EQ(f.status("j1"), JobStatus::Running);
}

// ── Selection order ─────────────────────────────────────────

TEST(SelectNext, FifoByDefault) {
    std::deque<QueueEntry> q = {{"a", 100, false, 0}, {"b", 101, false, 0}};
    EXPECT_EQ(select_next(q, 110, 60), 0u);
}

TEST(SelectNext, PlannedJobGoesFirst) {
    std::deque<QueueEntry> q = {{"a", 100, false, 0}, {"b", 101, true, 0}};
    EXPECT_EQ(select_next(q, 110, 60), 1u);
}

TEST(SelectNext, AgedJobIsPromoted) {
    std::deque<QueueEntry> q = {{"a", 100, false, 0}, {"b", 101, true, 0}};
    EXPECT_EQ(select_next(q, 160, 60), 0u);
}
