#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include "agent_client.hpp"

// Last observed reachability of a node's agent.
struct NodeStatus {
    bool known = false;         // at least one probe completed
    bool reachable = false;
    int64_t last_seen = 0;      // epoch secs of the last successful contact
    nlohmann::json last_stats;  // node-wide core/stats from that contact
    std::string last_error;
};

// Static catalog of configured nodes and their agent clients. Membership is
// fixed at construction; only the observed status changes.
class NodeRegistry {
public:
    using ClientFactory = std::function<std::shared_ptr<AgentClient>(const NodeConfig&)>;

    NodeRegistry(std::vector<NodeConfig> nodes, ClientFactory factory);

    const std::vector<NodeConfig>& nodes() const { return nodes_; }
    const NodeConfig* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    // NodeNotFound for an unknown id.
    Result<std::shared_ptr<AgentClient>> client(const std::string& id) const;

    // Record the outcome of a probe. Returns true when the node goes from
    // unreachable to reachable (the first successful probe does not count).
    bool record_contact(const std::string& id, bool ok, int64_t now,
                        const nlohmann::json& stats = nlohmann::json(),
                        const std::string& error = "");

    NodeStatus status(const std::string& id) const;

private:
    std::vector<NodeConfig> nodes_;
    std::map<std::string, std::shared_ptr<AgentClient>> clients_;

    mutable std::mutex mutex_;
    std::map<std::string, NodeStatus> status_;
};

// Real clients: libcurl transport against http://{address}:{port}.
NodeRegistry::ClientFactory make_rc_client_factory(const TimingConfig& timings);
