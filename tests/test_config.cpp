#include <gtest/gtest.h>
#include <core/config.hpp>

TEST(Config, Defaults) {
    auto r = Config::parse("nodes: []\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.listen().port, DEFAULT_LISTEN_PORT);
    EXPECT_EQ(r.value.db_path(), "rchub.db");
    EXPECT_TRUE(r.value.api_key().empty());
    EXPECT_EQ(r.value.timings().dispatch_max_attempts, DISPATCH_MAX_ATTEMPTS);
    EXPECT_FALSE(r.value.policy().require_plan_for_copy);
}

TEST(Config, ParsesNodesAndSections) {
    const char* yaml = R"(
listen:
  address: 127.0.0.1
  port: 9090
api_key: secret
storage:
  db_path: /var/lib/rchub/hub.db
policy:
  require_plan_for_copy: true
defaults:
  max_concurrent: 2
timings:
  plan_ttl_secs: 60
nodes:
  - id: nas
    address: 100.64.0.2
    max_queue_depth: 4
  - id: laptop
    ip: 100.64.0.3
    port: 5573
    max_concurrent: 1
)";
    auto r = Config::parse(yaml);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_EQ(c.listen().address, "127.0.0.1");
    EXPECT_EQ(c.listen().port, 9090);
    EXPECT_EQ(c.api_key(), "secret");
    EXPECT_EQ(c.db_path(), "/var/lib/rchub/hub.db");
    EXPECT_TRUE(c.policy().require_plan_for_copy);
    EXPECT_EQ(c.timings().plan_ttl_secs, 60);
    ASSERT_EQ(c.nodes().size(), 2u);

    const NodeConfig* nas = c.find_node("nas");
    ASSERT_NE(nas, nullptr);
    EXPECT_EQ(nas->max_concurrent, 2);
    EXPECT_EQ(nas->max_queue_depth, 4);
    EXPECT_EQ(nas->port, 5572);

    const NodeConfig* laptop = c.find_node("laptop");
    ASSERT_NE(laptop, nullptr);
    EXPECT_EQ(laptop->address, "100.64.0.3");
    EXPECT_EQ(laptop->port, 5573);
    EXPECT_EQ(laptop->max_concurrent, 1);
    EXPECT_EQ(c.find_node("desktop"), nullptr);
}

TEST(Config, RejectsDuplicateNode) {
    auto r = Config::parse("nodes:\n  - {id: a, address: x}\n  - {id: a, address: y}\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("duplicate id 'a'"), std::string::npos);
}

TEST(Config, RejectsNodeWithoutAddress) {
    auto r = Config::parse("nodes:\n  - {id: a}\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("address is required"), std::string::npos);
}

TEST(Config, RejectsBadPort) {
    EXPECT_TRUE(Config::parse("listen: {port: 70000}\n").is_err());
}

TEST(Config, RejectsWrongType) {
    auto r = Config::parse("listen: {port: eighty}\n");
    EXPECT_TRUE(r.is_err());
}

TEST(Config, RejectsNonListNodes) {
    EXPECT_TRUE(Config::parse("nodes: {id: a}\n").is_err());
}

TEST(Config, LoadMissingFile) {
    auto r = Config::load("/nonexistent/rchub.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not found"), std::string::npos);
}
