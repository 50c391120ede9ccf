#pragma once

#include <memory>
#include <string>
#include "agent_client.hpp"
#include "rc_transport.hpp"

// AgentClient over the rclone remote-control protocol.
class RcAgentClient : public AgentClient {
public:
    RcAgentClient(std::string node_id, std::unique_ptr<RcTransport> transport,
                  int rpc_timeout_ms, int stop_timeout_ms);

    Result<std::vector<BackendDescriptor>> list_backends() override;
    Result<int64_t> start_operation(JobKind kind, const std::string& src, const std::string& dst,
                                    const TransferFlags& flags, bool dry_run) override;
    Result<void> stop_operation(int64_t agent_job_id) override;
    Result<TransferStats> get_stats(int64_t agent_job_id) override;
    Result<std::set<int64_t>> list_active_jobs() override;
    Result<AgentJobStatus> get_job_status(int64_t agent_job_id) override;
    Result<std::vector<PlannedOperation>> list_operations(int64_t agent_job_id) override;
    Result<nlohmann::json> node_stats() override;

    // sync/copy, sync/move, sync/sync
    static const char* method_for(JobKind kind);

    // Full rc payload for an operation, exposed for tests.
    static nlohmann::json build_operation_payload(const std::string& src, const std::string& dst,
                                                  const TransferFlags& flags, bool dry_run);

private:
    Result<nlohmann::json> call(const std::string& method, const nlohmann::json& body);

    std::string node_id_;
    std::unique_ptr<RcTransport> transport_;
    int rpc_timeout_ms_;
    int stop_timeout_ms_;
};
