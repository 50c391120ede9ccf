#include <gtest/gtest.h>
#include <agent/node_registry.hpp>
#include <agent/rc_client.hpp>
#include "fake_agent_client.hpp"

using json = nlohmann::json;

namespace {

struct RcFixture {
    FakeRcTransport* transport;
    RcAgentClient client;

    RcFixture() : RcFixture(new FakeRcTransport()) {}

private:
    explicit RcFixture(FakeRcTransport* t)
        : transport(t), client("nas", std::unique_ptr<RcTransport>(t), 1000, 250) {}
};

} // namespace

TEST(RcClient, MethodForKind) {
    EXPECT_STREQ(RcAgentClient::method_for(JobKind::Copy), "sync/copy");
    EXPECT_STREQ(RcAgentClient::method_for(JobKind::Move), "sync/move");
    EXPECT_STREQ(RcAgentClient::method_for(JobKind::Sync), "sync/sync");
}

TEST(RcClient, OperationPayload) {
    auto flags = TransferFlags::from_json({{"transfers", 4}}, JobKind::Sync);
    ASSERT_TRUE(flags.is_ok());

    json p = RcAgentClient::build_operation_payload("local:/a", "b2:b", flags.value, false);
    EXPECT_EQ(p["srcFs"], "local:/a");
    EXPECT_EQ(p["dstFs"], "b2:b");
    EXPECT_EQ(p["_async"], true);
    EXPECT_EQ(p["_config"]["Transfers"], 4);
    EXPECT_FALSE(p["_config"].contains("DryRun"));

    json dry = RcAgentClient::build_operation_payload("local:/a", "b2:b", flags.value, true);
    EXPECT_EQ(dry["_config"]["DryRun"], true);
    EXPECT_EQ(dry["_config"]["Transfers"], 4);
}

TEST(RcClient, StartReturnsJobId) {
    RcFixture f;
    f.transport->replies["sync/move"] = Result<json>::Ok({{"jobid", 17}});

    auto r = f.client.start_operation(JobKind::Move, "a:", "b:", TransferFlags{}, false);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, 17);
    ASSERT_EQ(f.transport->calls.size(), 1u);
    EXPECT_EQ(f.transport->calls[0].method, "sync/move");
    EXPECT_EQ(f.transport->calls[0].timeout_ms, 1000);
}

TEST(RcClient, StartWithoutJobIdIsRejected) {
    RcFixture f;
    auto r = f.client.start_operation(JobKind::Copy, "a:", "b:", TransferFlags{}, false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::AgentRejected);
}

TEST(RcClient, TransportErrorsPassThrough) {
    RcFixture f;
    f.transport->replies["sync/copy"] = Result<json>::Err(ErrorKind::AgentUnreachable, "timeout");
    auto r = f.client.start_operation(JobKind::Copy, "a:", "b:", TransferFlags{}, false);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::AgentUnreachable);
}

TEST(RcClient, StopUsesStopTimeout) {
    RcFixture f;
    ASSERT_TRUE(f.client.stop_operation(5).is_ok());
    ASSERT_EQ(f.transport->calls.size(), 1u);
    EXPECT_EQ(f.transport->calls[0].method, "job/stop");
    EXPECT_EQ(f.transport->calls[0].body["jobid"], 5);
    EXPECT_EQ(f.transport->calls[0].timeout_ms, 250);
}

TEST(RcClient, StatsReadFromJobGroup) {
    RcFixture f;
    f.transport->replies["core/stats"] =
        Result<json>::Ok({{"bytes", 1024}, {"transfers", 3}, {"speed", 512.5}, {"errors", 1}});

    auto r = f.client.get_stats(9);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.bytes, 1024);
    EXPECT_EQ(r.value.files, 3);
    EXPECT_DOUBLE_EQ(r.value.speed, 512.5);
    EXPECT_EQ(r.value.errors, 1);
    EXPECT_EQ(f.transport->calls[0].body["group"], "job/9");
}

TEST(RcClient, ActiveJobsPreferRunningIds) {
    RcFixture f;
    f.transport->replies["job/list"] =
        Result<json>::Ok({{"jobids", {1, 2, 3}}, {"runningIds", {3}}, {"finishedIds", {1, 2}}});
    auto r = f.client.list_active_jobs();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, std::set<int64_t>({3}));
}

TEST(RcClient, ActiveJobsFallBackToJobIds) {
    RcFixture f;
    f.transport->replies["job/list"] = Result<json>::Ok({{"jobids", {4, 5}}});
    auto r = f.client.list_active_jobs();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, std::set<int64_t>({4, 5}));
}

TEST(RcClient, JobStatus) {
    RcFixture f;
    f.transport->replies["job/status"] =
        Result<json>::Ok({{"finished", true}, {"success", false}, {"error", "directory not found"}});
    auto r = f.client.get_job_status(3);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.finished);
    EXPECT_FALSE(r.value.success);
    EXPECT_EQ(r.value.error, "directory not found");
}

TEST(RcClient, OperationsFromTransferredList) {
    RcFixture f;
    f.transport->replies["core/transferred"] = Result<json>::Ok(
        {{"transferred",
          {{{"name", "a.txt"}, {"size", 10}, {"checked", false}},
           {{"name", "b.txt"}, {"size", 0}, {"checked", true}},
           {{"name", "c.txt"}, {"size", 5}, {"what", "deleting"}}}}});

    auto r = f.client.list_operations(8);
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 3u);
    EXPECT_EQ(r.value[0].action, "transferring");
    EXPECT_EQ(r.value[0].path, "a.txt");
    EXPECT_EQ(r.value[1].action, "checking");
    EXPECT_EQ(r.value[2].action, "deleting");
}

TEST(RcClient, BackendsSorted) {
    RcFixture f;
    f.transport->replies["config/listremotes"] = Result<json>::Ok({{"remotes", {"s3", "b2", "gdrive"}}});
    auto r = f.client.list_backends();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 3u);
    EXPECT_EQ(r.value[0].name, "b2");
    EXPECT_EQ(r.value[2].name, "s3");
}

// ── Reply classification ────────────────────────────────────

TEST(RcReply, OkParsesBody) {
    auto r = classify_rc_reply(200, R"({"jobid":1})", "sync/copy");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value["jobid"], 1);
}

TEST(RcReply, MalformedOkIsRejected) {
    auto r = classify_rc_reply(200, "not json", "sync/copy");
    EXPECT_EQ(r.kind, ErrorKind::AgentRejected);
}

TEST(RcReply, AuthFailure) {
    EXPECT_EQ(classify_rc_reply(401, "", "core/stats").kind, ErrorKind::AuthFailure);
    EXPECT_EQ(classify_rc_reply(403, "", "core/stats").kind, ErrorKind::AuthFailure);
}

TEST(RcReply, JobNotFound) {
    auto r = classify_rc_reply(500, R"({"error":"job not found","status":500})", "job/status");
    EXPECT_EQ(r.kind, ErrorKind::AgentJobNotFound);
}

TEST(RcReply, OtherErrorsCarryMessage) {
    auto r = classify_rc_reply(500, R"({"error":"didn't find section in config file"})", "sync/copy");
    EXPECT_EQ(r.kind, ErrorKind::AgentRejected);
    EXPECT_NE(r.error.find("didn't find section"), std::string::npos);
}

// ── NodeRegistry ────────────────────────────────────────────

TEST(NodeRegistry, UnknownNode) {
    auto agent = std::make_shared<FakeAgent>();
    NodeConfig n;
    n.id = "nas";
    n.address = "127.0.0.1";
    NodeRegistry registry({n}, [agent](const NodeConfig&) { return agent; });

    EXPECT_TRUE(registry.contains("nas"));
    EXPECT_TRUE(registry.client("nas").is_ok());
    auto missing = registry.client("laptop");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.kind, ErrorKind::NodeNotFound);
}

TEST(NodeRegistry, RecoveryOnlyAfterLoss) {
    auto agent = std::make_shared<FakeAgent>();
    NodeConfig n;
    n.id = "nas";
    n.address = "127.0.0.1";
    NodeRegistry registry({n}, [agent](const NodeConfig&) { return agent; });

    EXPECT_FALSE(registry.record_contact("nas", true, 10));
    EXPECT_FALSE(registry.record_contact("nas", true, 11));
    EXPECT_FALSE(registry.record_contact("nas", false, 12, nullptr, "timeout"));
    EXPECT_FALSE(registry.status("nas").reachable);
    EXPECT_EQ(registry.status("nas").last_error, "timeout");
    EXPECT_EQ(registry.status("nas").last_seen, 11);
    EXPECT_TRUE(registry.record_contact("nas", true, 13));
    EXPECT_TRUE(registry.status("nas").reachable);
}
