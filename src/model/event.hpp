#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Ephemeral stream item. Never persisted; exists only on the distribution path.
struct Event {
    enum class Kind { Stats, Terminal, Error };

    int64_t ts = 0;
    std::optional<std::string> job_id;
    std::optional<std::string> node_id;
    Kind kind = Kind::Stats;
    nlohmann::json payload = nlohmann::json::object();
};

const char* to_string(Event::Kind kind);

// {ts, jobId?, nodeId?, kind, payload}
nlohmann::json event_to_json(const Event& e);

// One NDJSON line, newline included.
std::string event_to_line(const Event& e);
