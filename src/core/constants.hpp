#pragma once

#include <cstdint>
#include <cstddef>

constexpr const char* RCHUB_VERSION = "0.4.0";

// ── Agent RPC ───────────────────────────────────────────────
constexpr int RPC_TIMEOUT_MS              = 10000;  // Every agent call is bounded by this
constexpr int RPC_CONNECT_TIMEOUT_MS      = 3000;
constexpr int STOP_TIMEOUT_MS             = 5000;   // Wait for the agent to confirm a stop

// ── Dispatch / retry ────────────────────────────────────────
constexpr int DISPATCH_MAX_ATTEMPTS       = 5;
constexpr int DISPATCH_BACKOFF_MS         = 1000;   // Doubled per attempt
constexpr int DISPATCH_BACKOFF_CAP_MS     = 30000;

// ── Polling ─────────────────────────────────────────────────
constexpr int CHECKPOINT_INTERVAL_MS      = 3000;
constexpr int CHECKPOINT_MAX_FAILURES     = 10;     // Consecutive failed polls before a job fails
constexpr int CHECKPOINT_BACKOFF_CAP_MS   = 30000;  // Failed polls back off, doubling, up to this
constexpr int NODE_POLL_INTERVAL_MS       = 2000;
constexpr int PLAN_POLL_INTERVAL_MS       = 500;

// ── Retention ───────────────────────────────────────────────
constexpr int64_t PLAN_TTL_SECS               = 15 * 60;
constexpr int64_t PLAN_WAIT_TIMEOUT_SECS      = 5 * 60;
constexpr int64_t IDEMPOTENCY_RETENTION_SECS  = 24 * 60 * 60;
constexpr int64_t PROMOTE_AFTER_SECS          = 60;
constexpr int64_t HOUSEKEEPING_INTERVAL_SECS  = 10 * 60;

// ── Admission defaults ──────────────────────────────────────
constexpr int DEFAULT_MAX_CONCURRENT      = 1;
constexpr int DEFAULT_MAX_QUEUE_DEPTH     = 32;

// ── Stream ──────────────────────────────────────────────────
constexpr std::size_t STREAM_QUEUE_LIMIT  = 1024;   // Per subscriber, oldest dropped beyond this
constexpr int STREAM_WAIT_MS              = 1000;
constexpr std::size_t STREAM_ENDED_JOBS    = 4096;   // Recent terminal jobs whose late stats are dropped

// ── HTTP ────────────────────────────────────────────────────
constexpr int DEFAULT_LISTEN_PORT         = 8080;
constexpr int DEFAULT_JOB_LIST_LIMIT      = 100;

// ── Job error reasons ───────────────────────────────────────
constexpr const char* REASON_LOST_ON_RESTART   = "lost-on-restart";
constexpr const char* REASON_INTERRUPTED       = "interrupted";
constexpr const char* REASON_AGENT_UNREACHABLE = "agent-unreachable";
constexpr const char* REASON_QUEUE_FULL        = "queue-full";
constexpr const char* REASON_INVALID_TOKEN     = "invalid-dry-run-token";
constexpr const char* NOTE_STOP_UNCONFIRMED    = "stop-unconfirmed";
constexpr const char* NOTE_STOP_CONFIRMED      = "stop-confirmed-on-restart";
