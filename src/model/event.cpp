#include "event.hpp"

using json = nlohmann::json;

const char* to_string(Event::Kind kind) {
    switch (kind) {
        case Event::Kind::Stats:    return "stats";
        case Event::Kind::Terminal: return "terminal";
        case Event::Kind::Error:    return "error";
    }
    return "stats";
}

json event_to_json(const Event& e) {
    json j = {{"ts", e.ts}, {"kind", to_string(e.kind)}, {"payload", e.payload}};
    if (e.job_id) j["jobId"] = *e.job_id;
    if (e.node_id) j["nodeId"] = *e.node_id;
    return j;
}

std::string event_to_line(const Event& e) {
    return event_to_json(e).dump() + "\n";
}
