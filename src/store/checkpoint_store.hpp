#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <agent/agent_client.hpp>
#include "database.hpp"

struct Checkpoint {
    int64_t ts = 0;
    int64_t bytes_transferred = 0;
    int64_t files_transferred = 0;
    double speed = 0.0;
    int64_t errors = 0;
};

nlohmann::json checkpoint_to_json(const Checkpoint& c);

// Write-through progress record for running jobs. record() returns only after
// the transaction is committed, so anything published afterwards has already
// survived a crash.
class CheckpointStore {
public:
    CheckpointStore(Database& db, NowFn now);

    // Persist progress for a running job and return what was stored.
    // Counters never move backwards: the stored value is max(previous, reported).
    //   JobNotFound  unknown uid
    //   Conflict     the job is no longer running
    Result<Checkpoint> record(const std::string& uid, const TransferStats& stats);

    // Audit history, oldest first.
    std::vector<Checkpoint> history(const std::string& uid);

private:
    Database& db_;
    NowFn now_;
};
