#include "database.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <sqlite3.h>

// ── Schema ─────────────────────────────────────────────────

static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS jobs (
  uid               TEXT PRIMARY KEY,
  node              TEXT NOT NULL,
  kind              TEXT NOT NULL,
  src               TEXT NOT NULL,
  dst               TEXT NOT NULL,
  flags             TEXT NOT NULL DEFAULT '{}',
  agent_job_id      INTEGER,
  status            TEXT NOT NULL,
  bytes_transferred INTEGER NOT NULL DEFAULT 0,
  files_transferred INTEGER NOT NULL DEFAULT 0,
  created_at        INTEGER NOT NULL,
  updated_at        INTEGER NOT NULL,
  error             TEXT NOT NULL DEFAULT '',
  note              TEXT NOT NULL DEFAULT '',
  dry_run_token     TEXT NOT NULL DEFAULT '',
  dispatch_attempts INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_jobs_status ON jobs(status);
CREATE INDEX IF NOT EXISTS idx_jobs_node ON jobs(node);

CREATE TABLE IF NOT EXISTS checkpoints (
  id                INTEGER PRIMARY KEY AUTOINCREMENT,
  uid               TEXT NOT NULL,
  ts                INTEGER NOT NULL,
  bytes_transferred INTEGER NOT NULL,
  files_transferred INTEGER NOT NULL,
  speed             REAL NOT NULL DEFAULT 0,
  errors            INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_checkpoints_uid ON checkpoints(uid);

CREATE TABLE IF NOT EXISTS idempotency_keys (
  key         TEXT PRIMARY KEY,
  fingerprint TEXT NOT NULL,
  job_uid     TEXT NOT NULL,
  created_at  INTEGER NOT NULL,
  expires_at  INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS dry_run_plans (
  token       TEXT PRIMARY KEY,
  node        TEXT NOT NULL,
  kind        TEXT NOT NULL,
  src         TEXT NOT NULL,
  dst         TEXT NOT NULL,
  flags       TEXT NOT NULL,
  operations  TEXT NOT NULL,
  created_at  INTEGER NOT NULL,
  expires_at  INTEGER NOT NULL,
  consumed_by TEXT,
  consumed_at INTEGER
);
)SQL";

// ── Database ───────────────────────────────────────────────

Database::Database(const std::string& path) : path_(path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(fmt::format("cannot open database {}: {}", path, msg));
    }
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=FULL;");
    init_schema();
    log_debug("db: opened {}", path);
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

void Database::init_schema() {
    exec(kSchema);
}

void Database::exec(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StorageError("SQLite error: " + msg);
    }
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

// ── Statement ──────────────────────────────────────────────

Statement::Statement(Database& db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        throw StorageError(fmt::format("prepare failed: {}: {}", sqlite3_errmsg(db_.handle()), sql));
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement& Statement::bind(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int idx, int64_t v) {
    sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
    return *this;
}

Statement& Statement::bind(int idx, double v) {
    sqlite3_bind_double(stmt_, idx, v);
    return *this;
}

Statement& Statement::bind_null(int idx) {
    sqlite3_bind_null(stmt_, idx);
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StorageError(fmt::format("step failed: {}", sqlite3_errmsg(db_.handle())));
}

void Statement::run() {
    while (step()) {}
}

std::string Statement::text(int col) const {
    const unsigned char* p = sqlite3_column_text(stmt_, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

int64_t Statement::int64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

double Statement::real(int col) const {
    return sqlite3_column_double(stmt_, col);
}

bool Statement::is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

// ── Transaction ────────────────────────────────────────────

Transaction::Transaction(Database& db) : db_(db), lock_(db.mutex()) {
    if (db_.tx_depth_ == 0) {
        db_.exec("BEGIN IMMEDIATE;");
    } else {
        savepoint_ = fmt::format("sp{}", db_.tx_depth_);
        db_.exec("SAVEPOINT " + savepoint_ + ";");
    }
    ++db_.tx_depth_;
}

Transaction::~Transaction() {
    if (done_) return;
    --db_.tx_depth_;
    std::string sql = savepoint_.empty()
        ? std::string("ROLLBACK;")
        : fmt::format("ROLLBACK TO {0}; RELEASE {0};", savepoint_);
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        log_error("db: rollback failed: {}", err ? err : "unknown");
        sqlite3_free(err);
    }
}

void Transaction::commit() {
    db_.exec(savepoint_.empty() ? std::string("COMMIT;") : "RELEASE " + savepoint_ + ";");
    --db_.tx_depth_;
    done_ = true;
}
