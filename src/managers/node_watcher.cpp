#include "node_watcher.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

using json = nlohmann::json;

NodeWatcher::NodeWatcher(NodeRegistry& nodes, EventStreamer& events, const TimingConfig& timings,
                         NowFn now)
    : nodes_(nodes), events_(events), timings_(timings), now_(std::move(now)) {}

NodeWatcher::~NodeWatcher() {
    stop();
}

void NodeWatcher::start() {
    if (!tasks_.empty()) return;
    for (const auto& n : nodes_.nodes()) {
        std::string id = n.id;
        tasks_.push_back(std::make_unique<PeriodicTask>(
            fmt::format("node-watch[{}]", id),
            std::chrono::milliseconds(timings_.node_poll_interval_ms),
            [this, id] {
                probe(id);
                return true;
            }));
    }
    log_info("node-watch: probing {} nodes every {}ms", tasks_.size(), timings_.node_poll_interval_ms);
}

void NodeWatcher::stop() {
    for (auto& t : tasks_) t->cancel();
    tasks_.clear();
}

bool NodeWatcher::probe(const std::string& node_id) {
    auto client = nodes_.client(node_id);
    if (client.is_err()) return false;

    auto stats = client.value->node_stats();
    int64_t now = now_();
    bool recovered = nodes_.record_contact(node_id, stats.is_ok(), now,
                                           stats.is_ok() ? stats.value : json(),
                                           stats.is_ok() ? "" : stats.error);
    if (stats.is_ok()) {
        events_.publish_node(node_id, Event::Kind::Stats, {{"ok", true}, {"stats", stats.value}});
    } else {
        events_.publish_node(node_id, Event::Kind::Error,
                             {{"ok", false},
                              {"code", error_kind_name(stats.kind)},
                              {"message", stats.error}});
    }

    if (recovered && on_recovered_) on_recovered_(node_id);
    return stats.is_ok();
}
