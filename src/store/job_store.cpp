#include "job_store.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

using json = nlohmann::json;

namespace {

const char* kJobColumns =
    "uid, node, kind, src, dst, flags, agent_job_id, status, bytes_transferred, "
    "files_transferred, created_at, updated_at, error, note, dry_run_token, dispatch_attempts";

Job read_job(const Statement& st) {
    Job j;
    j.uid = st.text(0);
    j.node = st.text(1);
    j.kind = parse_job_kind(st.text(2)).value_or(JobKind::Copy);
    j.src = st.text(3);
    j.dst = st.text(4);
    try {
        auto parsed = TransferFlags::from_json(json::parse(st.text(5)), j.kind);
        if (parsed.is_ok()) j.flags = parsed.value;
    } catch (const json::parse_error& e) {
        log_warn("jobs: {} has unreadable flags: {}", j.uid, e.what());
    }
    if (!st.is_null(6)) j.agent_job_id = st.int64(6);
    j.status = parse_job_status(st.text(7)).value_or(JobStatus::Failed);
    j.bytes_transferred = st.int64(8);
    j.files_transferred = st.int64(9);
    j.created_at = st.int64(10);
    j.updated_at = st.int64(11);
    j.error = st.text(12);
    j.note = st.text(13);
    j.dry_run_token = st.text(14);
    j.dispatch_attempts = static_cast<int>(st.int64(15));
    return j;
}

std::vector<Job> read_all(Statement& st) {
    std::vector<Job> out;
    while (st.step()) out.push_back(read_job(st));
    return out;
}

} // namespace

JobStore::JobStore(Database& db, NowFn now) : db_(db), now_(std::move(now)) {}

void JobStore::insert(Job& job) {
    job.created_at = now_();
    job.updated_at = job.created_at;

    Transaction tx(db_);
    {
        Statement st(db_, fmt::format("INSERT INTO jobs ({}) VALUES "
                                      "(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)", kJobColumns).c_str());
        st.bind(1, job.uid).bind(2, job.node).bind(3, std::string(to_string(job.kind)))
          .bind(4, job.src).bind(5, job.dst).bind(6, job.flags.canonical());
        if (job.agent_job_id) st.bind(7, *job.agent_job_id); else st.bind_null(7);
        st.bind(8, std::string(to_string(job.status)))
          .bind(9, job.bytes_transferred).bind(10, job.files_transferred)
          .bind(11, job.created_at).bind(12, job.updated_at)
          .bind(13, job.error).bind(14, job.note).bind(15, job.dry_run_token)
          .bind(16, job.dispatch_attempts);
        st.run();
    }
    tx.commit();
    append_job_log(job.uid, fmt::format("created {} {} -> {} on {} status={}",
                                        to_string(job.kind), job.src, job.dst, job.node,
                                        to_string(job.status)));
}

std::optional<Job> JobStore::get(const std::string& uid) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    return get_locked(uid);
}

std::optional<Job> JobStore::get_locked(const std::string& uid) {
    Statement st(db_, fmt::format("SELECT {} FROM jobs WHERE uid = ?", kJobColumns).c_str());
    st.bind(1, uid);
    if (!st.step()) return std::nullopt;
    return read_job(st);
}

void JobStore::write_locked(const Job& job) {
    Statement st(db_,
                 "UPDATE jobs SET agent_job_id = ?, status = ?, bytes_transferred = ?, "
                 "files_transferred = ?, updated_at = ?, error = ?, note = ?, "
                 "dry_run_token = ?, dispatch_attempts = ? WHERE uid = ?");
    if (job.agent_job_id) st.bind(1, *job.agent_job_id); else st.bind_null(1);
    st.bind(2, std::string(to_string(job.status)))
      .bind(3, job.bytes_transferred).bind(4, job.files_transferred)
      .bind(5, job.updated_at).bind(6, job.error).bind(7, job.note)
      .bind(8, job.dry_run_token).bind(9, job.dispatch_attempts).bind(10, job.uid);
    st.run();
}

std::vector<Job> JobStore::list(const JobFilter& filter) {
    std::string sql = fmt::format("SELECT {} FROM jobs WHERE 1=1", kJobColumns);
    if (filter.status) sql += " AND status = ?";
    if (filter.node) sql += " AND node = ?";
    sql += " ORDER BY created_at DESC, rowid DESC LIMIT ?";

    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement st(db_, sql.c_str());
    int idx = 1;
    if (filter.status) st.bind(idx++, std::string(to_string(*filter.status)));
    if (filter.node) st.bind(idx++, *filter.node);
    st.bind(idx, static_cast<int64_t>(std::max(filter.limit, 1)));
    return read_all(st);
}

std::vector<Job> JobStore::list_by_status(JobStatus status) {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement st(db_, fmt::format("SELECT {} FROM jobs WHERE status = ? "
                                  "ORDER BY created_at ASC, rowid ASC", kJobColumns).c_str());
    st.bind(1, std::string(to_string(status)));
    return read_all(st);
}

std::vector<Job> JobStore::list_non_terminal() {
    std::lock_guard<std::recursive_mutex> lock(db_.mutex());
    Statement st(db_, fmt::format("SELECT {} FROM jobs WHERE status NOT IN "
                                  "('completed', 'failed', 'stopped') "
                                  "ORDER BY created_at ASC, rowid ASC", kJobColumns).c_str());
    return read_all(st);
}

Result<Job> JobStore::transition(const std::string& uid, std::initializer_list<JobStatus> from,
                                 JobStatus to, const Mutator& mutate) {
    Transaction tx(db_);
    auto current = get_locked(uid);
    if (!current) {
        return Result<Job>::Err(ErrorKind::JobNotFound, fmt::format("job {} not found", uid));
    }

    Job job = *current;
    bool allowed = std::find(from.begin(), from.end(), job.status) != from.end();
    if (!allowed || !can_transition(job.status, to)) {
        return Result<Job>::Err(ErrorKind::Conflict,
                                fmt::format("job {} is {}, cannot become {}", uid,
                                            to_string(job.status), to_string(to)));
    }

    JobStatus prev = job.status;
    job.status = to;
    if (mutate) mutate(job);
    job.status = to;
    job.updated_at = now_();

    if (to == JobStatus::Queued && is_destructive(job.kind) && job.dry_run_token.empty()) {
        return Result<Job>::Err(ErrorKind::InvalidRequest,
                                fmt::format("{} job {} cannot be queued without a dry-run plan",
                                            to_string(job.kind), uid));
    }

    write_locked(job);
    tx.commit();

    std::string line = fmt::format("{} -> {}", to_string(prev), to_string(to));
    if (job.agent_job_id && to == JobStatus::Running) line += fmt::format(" agent_job={}", *job.agent_job_id);
    if (!job.error.empty() && to == JobStatus::Failed) line += " error=" + job.error;
    if (!job.note.empty()) line += " note=" + job.note;
    append_job_log(uid, line);
    return Result<Job>::Ok(job);
}

Result<Job> JobStore::update(const std::string& uid, const Mutator& mutate) {
    Transaction tx(db_);
    auto current = get_locked(uid);
    if (!current) {
        return Result<Job>::Err(ErrorKind::JobNotFound, fmt::format("job {} not found", uid));
    }
    Job job = *current;
    JobStatus status = job.status;
    mutate(job);
    job.status = status;
    job.updated_at = now_();
    write_locked(job);
    tx.commit();
    return Result<Job>::Ok(job);
}
