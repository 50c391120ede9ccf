#include "idempotency_store.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

IdempotencyStore::IdempotencyStore(Database& db, NowFn now, int64_t retention_secs)
    : db_(db), now_(std::move(now)), retention_secs_(retention_secs) {}

Result<Reservation> IdempotencyStore::reserve(const std::string& key, const std::string& fingerprint,
                                              const std::string& candidate_uid,
                                              const OnCreate& on_create) {
    if (key.empty()) {
        return Result<Reservation>::Err(ErrorKind::InvalidRequest, "empty idempotency key");
    }

    int64_t now = now_();
    Transaction tx(db_);
    {
        Statement st(db_, "SELECT fingerprint, job_uid, expires_at FROM idempotency_keys WHERE key = ?");
        st.bind(1, key);
        if (st.step() && st.int64(2) > now) {
            if (st.text(0) != fingerprint) {
                return Result<Reservation>::Err(
                    ErrorKind::IdempotencyConflict,
                    fmt::format("idempotency key '{}' was used for a different request", key));
            }
            return Result<Reservation>::Ok(Reservation{false, st.text(1)});
        }
    }

    {
        Statement st(db_, "INSERT OR REPLACE INTO idempotency_keys "
                          "(key, fingerprint, job_uid, created_at, expires_at) VALUES (?,?,?,?,?)");
        st.bind(1, key).bind(2, fingerprint).bind(3, candidate_uid)
          .bind(4, now).bind(5, now + retention_secs_);
        st.run();
    }
    if (on_create) on_create(candidate_uid);
    tx.commit();
    return Result<Reservation>::Ok(Reservation{true, candidate_uid});
}

void IdempotencyStore::release(const std::string& key) {
    Transaction tx(db_);
    Statement st(db_, "DELETE FROM idempotency_keys WHERE key = ?");
    st.bind(1, key);
    st.run();
    tx.commit();
}

int IdempotencyStore::purge_expired() {
    Transaction tx(db_);
    int removed = 0;
    {
        Statement st(db_, "DELETE FROM idempotency_keys WHERE expires_at <= ?");
        st.bind(1, now_());
        st.run();
        removed = db_.changes();
    }
    tx.commit();
    if (removed > 0) log_debug("idempotency: purged {} expired keys", removed);
    return removed;
}

std::string request_fingerprint(const std::string& kind, const std::string& node,
                                const std::string& src, const std::string& dst,
                                const std::string& canonical_flags) {
    return nlohmann::json::array({kind, node, src, dst, canonical_flags}).dump();
}
