#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <model/job.hpp>
#include "database.hpp"

struct JobFilter {
    std::optional<JobStatus> status;
    std::optional<std::string> node;
    int limit = DEFAULT_JOB_LIST_LIMIT;
};

// Durable Jobs table. Every status change goes through transition(), a
// check-and-set inside one transaction, so two workers can never move the
// same job concurrently.
class JobStore {
public:
    using Mutator = std::function<void(Job&)>;

    JobStore(Database& db, NowFn now);

    // Insert a new job; created_at/updated_at are stamped here.
    void insert(Job& job);

    std::optional<Job> get(const std::string& uid);

    // Newest first.
    std::vector<Job> list(const JobFilter& filter);

    // Oldest first (creation order).
    std::vector<Job> list_by_status(JobStatus status);
    std::vector<Job> list_non_terminal();

    // Move `uid` from one of `from` to `to`, applying `mutate` to the stored
    // record in the same transaction.
    //   JobNotFound     unknown uid
    //   Conflict        current status not in `from`, or the move breaks the state machine
    //   InvalidRequest  destructive job entering queued without a consumed plan token
    Result<Job> transition(const std::string& uid, std::initializer_list<JobStatus> from,
                           JobStatus to, const Mutator& mutate = nullptr);

    // Non-status updates on a live job (dispatch attempt counter, note).
    Result<Job> update(const std::string& uid, const Mutator& mutate);

    // For callers that group a transition with other writes in one transaction.
    Database& db() { return db_; }

private:
    std::optional<Job> get_locked(const std::string& uid);
    void write_locked(const Job& job);

    Database& db_;
    NowFn now_;
};
