#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <managers/dry_run_planner.hpp>
#include <managers/hub_service.hpp>
#include "test_support.hpp"

namespace {

struct PlannerFixture {
    TempDb tmp;
    FakeClock clock;
    FakeFleet fleet;
    std::shared_ptr<FakeAgent> agent = fleet.add("nas");
    TimingConfig timings;
    Database db{tmp.path};
    std::unique_ptr<NodeRegistry> registry;
    std::unique_ptr<DryRunPlanner> planner;

    PlannerFixture() {
        timings.plan_ttl_secs = 900;
        timings.plan_poll_interval_ms = 10;
        timings.plan_wait_timeout_secs = 1;
        registry = std::make_unique<NodeRegistry>(std::vector<NodeConfig>{test_node("nas")},
                                                  fleet.factory());
        planner = std::make_unique<DryRunPlanner>(db, *registry, timings, clock.fn());
    }

    PlanRequest sync_request() {
        PlanRequest r;
        r.node = "nas";
        r.kind = JobKind::Sync;
        r.src = "local:/photos";
        r.dst = "b2:photos";
        return r;
    }
};

} // namespace

TEST(DryRunPlanner, PlanCapturesOperations) {
    PlannerFixture f;
    auto plan = f.planner->plan(f.sync_request());
    ASSERT_TRUE(plan.is_ok()) << plan.error;
    EXPECT_EQ(plan.value.token.size(), 32u);
    ASSERT_EQ(plan.value.operations.size(), 2u);
    EXPECT_EQ(plan.value.operations[1].action, "deleting");
    EXPECT_EQ(plan.value.expires_at, plan.value.created_at + 900);

    ASSERT_EQ(f.agent->starts.size(), 1u);
    EXPECT_TRUE(f.agent->starts[0].dry_run);
    EXPECT_EQ(f.agent->real_starts(), 0);

    auto j = plan_to_json(plan.value);
    EXPECT_EQ(j["kind"], "sync");
    EXPECT_EQ(j["plannedOperations"].size(), 2u);
}

TEST(DryRunPlanner, UnknownNode) {
    PlannerFixture f;
    auto req = f.sync_request();
    req.node = "laptop";
    EXPECT_EQ(f.planner->plan(req).kind, ErrorKind::NodeNotFound);
}

TEST(DryRunPlanner, UnreachableAgent) {
    PlannerFixture f;
    f.agent->set_unreachable(true);
    EXPECT_EQ(f.planner->plan(f.sync_request()).kind, ErrorKind::AgentUnreachable);
}

TEST(DryRunPlanner, FailedDryRunIsRejected) {
    PlannerFixture f;
    f.agent->dry_run_error = "directory not found";
    auto r = f.planner->plan(f.sync_request());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::AgentRejected);
    EXPECT_NE(r.error.find("directory not found"), std::string::npos);
}

TEST(DryRunPlanner, StuckDryRunTimesOutAndIsStopped) {
    PlannerFixture f;
    f.agent->hold_dry_runs = true;
    auto r = f.planner->plan(f.sync_request());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::AgentUnreachable);
    ASSERT_EQ(f.agent->stops.size(), 1u);
    EXPECT_EQ(f.agent->stops[0], f.agent->last_id());
}

TEST(DryRunPlanner, TokenIsSingleUse) {
    PlannerFixture f;
    auto req = f.sync_request();
    auto plan = f.planner->plan(req);
    ASSERT_TRUE(plan.is_ok());

    auto first = f.planner->validate(plan.value.token, req, "job-1");
    ASSERT_TRUE(first.is_ok()) << first.error;
    EXPECT_EQ(first.value.operations.size(), 2u);

    auto second = f.planner->validate(plan.value.token, req, "job-2");
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.kind, ErrorKind::InvalidDryRunToken);
}

TEST(DryRunPlanner, MismatchDoesNotConsume) {
    PlannerFixture f;
    auto req = f.sync_request();
    auto plan = f.planner->plan(req);
    ASSERT_TRUE(plan.is_ok());

    auto other = req;
    other.dst = "b2:elsewhere";
    EXPECT_EQ(f.planner->validate(plan.value.token, other, "job-1").kind, ErrorKind::InvalidDryRunToken);

    auto kind = req;
    kind.kind = JobKind::Move;
    EXPECT_EQ(f.planner->validate(plan.value.token, kind, "job-1").kind, ErrorKind::InvalidDryRunToken);

    auto flags = req;
    flags.flags.checksum = true;
    EXPECT_EQ(f.planner->validate(plan.value.token, flags, "job-1").kind, ErrorKind::InvalidDryRunToken);

    EXPECT_TRUE(f.planner->validate(plan.value.token, req, "job-1").is_ok());
}

TEST(DryRunPlanner, ExpiredTokenRejected) {
    PlannerFixture f;
    auto req = f.sync_request();
    auto plan = f.planner->plan(req);
    ASSERT_TRUE(plan.is_ok());

    f.clock.advance(901);
    EXPECT_EQ(f.planner->validate(plan.value.token, req, "job-1").kind, ErrorKind::InvalidDryRunToken);
    EXPECT_EQ(f.planner->purge_expired(), 1);
}

TEST(DryRunPlanner, EmptyAndUnknownTokens) {
    PlannerFixture f;
    auto req = f.sync_request();
    EXPECT_EQ(f.planner->validate("", req, "job-1").kind, ErrorKind::InvalidDryRunToken);
    EXPECT_EQ(f.planner->validate("deadbeef", req, "job-1").kind, ErrorKind::InvalidDryRunToken);
}

TEST(DryRunPlanner, ConcurrentStartsConsumeTokenOnce) {
    TempDb tmp;
    FakeClock clock;
    FakeFleet fleet;
    auto agent = fleet.add("nas");
    HubService hub(test_config(tmp.path, {test_node("nas", 1, 32)}), fleet.factory(), clock.fn());
    hub.start(false);

    PlanRequest req{"nas", JobKind::Sync, "local:/photos", "b2:photos", TransferFlags{}};
    auto plan = hub.plan_job(req);
    ASSERT_TRUE(plan.is_ok()) << plan.error;

    const int kThreads = 8;
    std::atomic<int> queued{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            CreateJobRequest create;
            create.idempotency_key = "key-" + std::to_string(i);
            create.kind = JobKind::Sync;
            create.node = "nas";
            create.src = req.src;
            create.dst = req.dst;
            create.dry_run_token = plan.value.token;
            auto r = hub.create_job(create);
            if (r.is_ok() && r.value.job.status == JobStatus::Queued) {
                queued++;
            } else if (r.kind == ErrorKind::InvalidDryRunToken) {
                rejected++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(queued.load(), 1);
    EXPECT_EQ(rejected.load(), kThreads - 1);
    EXPECT_EQ(hub.queue().queued_count("nas"), 1u);
    EXPECT_EQ(agent->real_starts(), 0);
}
