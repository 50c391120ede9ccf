#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <core/periodic_task.hpp>
#include <core/types.hpp>
#include <agent/node_registry.hpp>
#include "event_streamer.hpp"

// Probes every node's agent on a fixed cadence: records reachability in the
// registry, streams node-level stats or error events, and reports nodes that
// come back after an outage.
class NodeWatcher {
public:
    using NodeCallback = std::function<void(const std::string& node_id)>;

    NodeWatcher(NodeRegistry& nodes, EventStreamer& events, const TimingConfig& timings, NowFn now);
    ~NodeWatcher();

    void set_on_recovered(NodeCallback cb) { on_recovered_ = std::move(cb); }

    void start();
    void stop();

    // One probe of one node. Returns reachability.
    bool probe(const std::string& node_id);

private:
    NodeRegistry& nodes_;
    EventStreamer& events_;
    TimingConfig timings_;
    NowFn now_;
    NodeCallback on_recovered_;
    std::vector<std::unique_ptr<PeriodicTask>> tasks_;
};
