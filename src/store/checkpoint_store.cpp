#include "checkpoint_store.hpp"
#include <model/job.hpp>
#include <fmt/format.h>
#include <algorithm>

using json = nlohmann::json;

json checkpoint_to_json(const Checkpoint& c) {
    return {
        {"ts", c.ts},
        {"bytesTransferred", c.bytes_transferred},
        {"filesTransferred", c.files_transferred},
        {"speed", c.speed},
        {"errors", c.errors},
    };
}

CheckpointStore::CheckpointStore(Database& db, NowFn now) : db_(db), now_(std::move(now)) {}

Result<Checkpoint> CheckpointStore::record(const std::string& uid, const TransferStats& stats) {
    int64_t ts = now_();
    Transaction tx(db_);

    std::string status;
    int64_t bytes = 0;
    int64_t files = 0;
    {
        Statement st(db_, "SELECT status, bytes_transferred, files_transferred FROM jobs WHERE uid = ?");
        st.bind(1, uid);
        if (!st.step()) {
            return Result<Checkpoint>::Err(ErrorKind::JobNotFound,
                                           fmt::format("job {} not found", uid));
        }
        status = st.text(0);
        bytes = st.int64(1);
        files = st.int64(2);
    }
    if (status != to_string(JobStatus::Running)) {
        return Result<Checkpoint>::Err(ErrorKind::Conflict,
                                       fmt::format("job {} is {}, not running", uid, status));
    }

    bytes = std::max(bytes, stats.bytes);
    files = std::max(files, stats.files);
    {
        Statement st(db_, "UPDATE jobs SET bytes_transferred = ?, files_transferred = ?, "
                          "updated_at = ? WHERE uid = ?");
        st.bind(1, bytes).bind(2, files).bind(3, ts).bind(4, uid);
        st.run();
    }
    {
        Statement st(db_, "INSERT INTO checkpoints (uid, ts, bytes_transferred, files_transferred, "
                          "speed, errors) VALUES (?,?,?,?,?,?)");
        st.bind(1, uid).bind(2, ts).bind(3, bytes).bind(4, files)
          .bind(5, stats.speed).bind(6, stats.errors);
        st.run();
    }
    tx.commit();

    Checkpoint c;
    c.ts = ts;
    c.bytes_transferred = bytes;
    c.files_transferred = files;
    c.speed = stats.speed;
    c.errors = stats.errors;
    return Result<Checkpoint>::Ok(c);
}

std::vector<Checkpoint> CheckpointStore::history(const std::string& uid) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement st(db_, "SELECT ts, bytes_transferred, files_transferred, speed, errors "
                      "FROM checkpoints WHERE uid = ? ORDER BY id ASC");
    st.bind(1, uid);
    std::vector<Checkpoint> out;
    while (st.step()) {
        Checkpoint c;
        c.ts = st.int64(0);
        c.bytes_transferred = st.int64(1);
        c.files_transferred = st.int64(2);
        c.speed = st.real(3);
        c.errors = st.int64(4);
        out.push_back(c);
    }
    return out;
}
