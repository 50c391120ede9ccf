#include "node_registry.hpp"
#include "rc_client.hpp"
#include "rc_transport.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

NodeRegistry::NodeRegistry(std::vector<NodeConfig> nodes, ClientFactory factory)
    : nodes_(std::move(nodes)) {
    for (const auto& n : nodes_) {
        clients_[n.id] = factory(n);
        status_[n.id] = NodeStatus{};
    }
}

const NodeConfig* NodeRegistry::find(const std::string& id) const {
    for (const auto& n : nodes_) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

Result<std::shared_ptr<AgentClient>> NodeRegistry::client(const std::string& id) const {
    auto it = clients_.find(id);
    if (it == clients_.end() || !it->second) {
        return Result<std::shared_ptr<AgentClient>>::Err(ErrorKind::NodeNotFound,
                                                         fmt::format("unknown node '{}'", id));
    }
    return Result<std::shared_ptr<AgentClient>>::Ok(it->second);
}

bool NodeRegistry::record_contact(const std::string& id, bool ok, int64_t now,
                                  const nlohmann::json& stats, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = status_.find(id);
    if (it == status_.end()) return false;

    NodeStatus& s = it->second;
    bool recovered = s.known && !s.reachable && ok;
    bool lost = (!s.known || s.reachable) && !ok;

    s.known = true;
    s.reachable = ok;
    if (ok) {
        s.last_seen = now;
        s.last_stats = stats;
        s.last_error.clear();
    } else {
        s.last_error = error;
    }

    if (recovered) log_info("node {}: agent reachable again", id);
    if (lost) log_warn("node {}: agent unreachable: {}", id, error);
    return recovered;
}

NodeStatus NodeRegistry::status(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = status_.find(id);
    return it == status_.end() ? NodeStatus{} : it->second;
}

NodeRegistry::ClientFactory make_rc_client_factory(const TimingConfig& timings) {
    return [timings](const NodeConfig& node) -> std::shared_ptr<AgentClient> {
        RcEndpoint ep;
        ep.base_url = fmt::format("http://{}:{}", node.address, node.port);
        ep.user = node.user;
        ep.password = node.password;
        ep.connect_timeout_ms = timings.connect_timeout_ms;
        return std::make_shared<RcAgentClient>(node.id, std::make_unique<CurlRcTransport>(ep),
                                               timings.rpc_timeout_ms, timings.stop_timeout_ms);
    };
}
