#pragma once

#include <functional>
#include <string>
#include <core/types.hpp>
#include "database.hpp"

struct Reservation {
    bool created = false;
    std::string job_uid;
};

// Durable client-key -> job mapping used to de-duplicate retried writes.
class IdempotencyStore {
public:
    // Runs inside the reservation transaction when a new key is recorded, so
    // the key and the job row it points at commit together.
    using OnCreate = std::function<void(const std::string& job_uid)>;

    IdempotencyStore(Database& db, NowFn now, int64_t retention_secs);

    // Atomic check-and-set.
    //   unseen (or expired) key  -> {created=true,  candidate_uid}
    //   same key, same request   -> {created=false, uid recorded earlier}
    //   same key, other request  -> IdempotencyConflict
    Result<Reservation> reserve(const std::string& key, const std::string& fingerprint,
                                const std::string& candidate_uid,
                                const OnCreate& on_create = nullptr);

    // Forget a key so the client can retry with it (request failed its gate).
    void release(const std::string& key);

    // Drop expired records. Returns the number removed.
    int purge_expired();

private:
    Database& db_;
    NowFn now_;
    int64_t retention_secs_;
};

// Fingerprint of a job request: the JSON array [kind, node, src, dst, canonical flags].
// Stored verbatim, so distinct requests never share a fingerprint.
std::string request_fingerprint(const std::string& kind, const std::string& node,
                                const std::string& src, const std::string& dst,
                                const std::string& canonical_flags);
