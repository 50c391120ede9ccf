#pragma once

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

// Thrown when SQLite itself fails (I/O error, corruption, full disk). Callers
// at worker and API boundaries catch it and report StorageFailure.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

// Single shared SQLite connection: WAL journal, synchronous=FULL so a
// committed transaction is on disk before the commit returns.
//
// All access goes through mutex(); Transaction takes it for the whole
// BEGIN IMMEDIATE .. COMMIT span, plain reads take it per query.
class Database {
public:
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void exec(const std::string& sql);
    int changes() const;

    sqlite3* handle() { return db_; }
    std::recursive_mutex& mutex() { return mutex_; }
    const std::string& path() const { return path_; }

private:
    friend class Transaction;
    void init_schema();

    sqlite3* db_{nullptr};
    std::string path_;
    std::recursive_mutex mutex_;
    int tx_depth_ = 0;          // guarded by mutex_
};

// Prepared statement, finalized on destruction. Bind indexes are 1-based,
// column indexes 0-based, as in the C API.
class Statement {
public:
    Statement(Database& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& v);
    Statement& bind(int idx, int64_t v);
    Statement& bind(int idx, int v) { return bind(idx, static_cast<int64_t>(v)); }
    Statement& bind(int idx, double v);
    Statement& bind_null(int idx);

    // True while a row is available; false once done.
    bool step();
    // For statements that return no rows.
    void run();

    std::string text(int col) const;
    int64_t int64(int col) const;
    double real(int col) const;
    bool is_null(int col) const;

private:
    Database& db_;
    sqlite3_stmt* stmt_{nullptr};
};

// BEGIN IMMEDIATE on construction: the write lock is taken up front, so the
// reads inside form an atomic check-and-set with the writes. Rolls back
// unless commit() was called. A Transaction opened inside another one on the
// same thread becomes a SAVEPOINT and commits with its parent.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    std::string savepoint_;     // empty for the outermost transaction
    bool done_ = false;
};
