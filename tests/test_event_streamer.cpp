#include <gtest/gtest.h>
#include <thread>
#include <managers/event_streamer.hpp>
#include "test_support.hpp"

using namespace std::chrono_literals;

namespace {

Job running_job(const std::string& uid) {
    Job j;
    j.uid = uid;
    j.node = "nas";
    j.status = JobStatus::Running;
    j.bytes_transferred = 10;
    return j;
}

} // namespace

TEST(EventStreamer, SnapshotPrecedesLiveEvents) {
    FakeClock clock;
    std::vector<Job> live = {running_job("a"), running_job("b")};
    EventStreamer streamer([&] { return live; }, 16, clock.fn());

    auto sub = streamer.subscribe();
    Job a = live[0];
    a.bytes_transferred = 20;
    streamer.publish_job_stats(a, 5.0, 0);

    auto first = sub->next(0ms);
    auto second = sub->next(0ms);
    auto third = sub->next(0ms);
    ASSERT_TRUE(first && second && third);
    EXPECT_EQ(first->payload["snapshot"], true);
    EXPECT_EQ(*first->job_id, "a");
    EXPECT_EQ(*second->job_id, "b");
    EXPECT_FALSE(third->payload.contains("snapshot"));
    EXPECT_EQ(third->payload["bytesTransferred"], 20);
    EXPECT_FALSE(sub->next(0ms).has_value());
}

TEST(EventStreamer, FansOutToAllSubscribers) {
    FakeClock clock;
    EventStreamer streamer(nullptr, 16, clock.fn());
    auto s1 = streamer.subscribe();
    auto s2 = streamer.subscribe();
    EXPECT_EQ(streamer.subscriber_count(), 2u);

    Job done = running_job("a");
    done.status = JobStatus::Completed;
    streamer.publish_terminal(done);

    for (auto& s : {s1, s2}) {
        auto e = s->next(0ms);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->kind, Event::Kind::Terminal);
        EXPECT_EQ(e->payload["status"], "completed");
    }
}

TEST(EventStreamer, NoStatsAfterTerminal) {
    FakeClock clock;
    EventStreamer streamer(nullptr, 16, clock.fn());
    auto sub = streamer.subscribe();

    Job stopped = running_job("a");
    stopped.status = JobStatus::Stopped;
    streamer.publish_terminal(stopped);
    streamer.publish_job_stats(running_job("a"), 1.0, 0);
    streamer.publish_job_stats(running_job("b"), 1.0, 0);

    auto first = sub->next(0ms);
    auto second = sub->next(0ms);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->kind, Event::Kind::Terminal);
    EXPECT_EQ(*first->job_id, "a");
    EXPECT_EQ(second->kind, Event::Kind::Stats);
    EXPECT_EQ(*second->job_id, "b");
    EXPECT_FALSE(sub->next(0ms).has_value());
}

TEST(EventStreamer, SlowSubscriberDropsOldest) {
    FakeClock clock;
    EventStreamer streamer(nullptr, 3, clock.fn());
    auto sub = streamer.subscribe();

    for (int i = 0; i < 5; ++i) {
        streamer.publish_node("nas", Event::Kind::Stats, {{"seq", i}});
    }
    EXPECT_EQ(sub->dropped(), 2u);
    EXPECT_EQ(streamer.dropped_total(), 2u);

    auto e = sub->next(0ms);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->payload["seq"], 2);
    EXPECT_EQ(*e->node_id, "nas");
    EXPECT_FALSE(e->job_id.has_value());
}

TEST(EventStreamer, SlowSubscriberDoesNotAffectOthers) {
    FakeClock clock;
    EventStreamer streamer(nullptr, 2, clock.fn());
    auto slow = streamer.subscribe();
    auto fast = streamer.subscribe();

    for (int i = 0; i < 4; ++i) {
        streamer.publish_node("nas", Event::Kind::Stats, {{"seq", i}});
        auto e = fast->next(0ms);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->payload["seq"], i);
    }
    EXPECT_EQ(fast->dropped(), 0u);
    EXPECT_EQ(slow->dropped(), 2u);
}

TEST(EventStreamer, UnsubscribeStopsDelivery) {
    FakeClock clock;
    EventStreamer streamer(nullptr, 16, clock.fn());
    auto sub = streamer.subscribe();
    streamer.unsubscribe(sub);
    EXPECT_EQ(streamer.subscriber_count(), 0u);
    EXPECT_TRUE(sub->closed());

    streamer.publish_node("nas", Event::Kind::Error, {{"ok", false}});
    EXPECT_FALSE(sub->next(0ms).has_value());
}

TEST(EventStreamer, CloseAllWakesBlockedReader) {
    FakeClock clock;
    EventStreamer streamer(nullptr, 16, clock.fn());
    auto sub = streamer.subscribe();

    std::thread reader([&] { EXPECT_FALSE(sub->next(10s).has_value()); });
    std::this_thread::sleep_for(20ms);
    auto start = std::chrono::steady_clock::now();
    streamer.close_all();
    reader.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_TRUE(sub->closed());
}
