#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>
#include <set>

namespace fs = std::filesystem;

// ── Section parsers ──────────────────────────────────────────
// Missing keys keep their defaults; present keys of the wrong type surface as
// YAML::Exception and are reported with the section name.

static void parse_listen(const YAML::Node& node, ListenConfig& listen) {
    if (!node) return;
    listen.address = node["address"].as<std::string>(listen.address);
    listen.port = node["port"].as<int>(listen.port);
}

static void parse_logging(const YAML::Node& node, LoggingConfig& logging) {
    if (!node) return;
    logging.path = node["path"].as<std::string>(logging.path);
    logging.job_log_dir = node["job_log_dir"].as<std::string>(logging.job_log_dir);
    logging.level = node["level"].as<std::string>(logging.level);
}

static void parse_timings(const YAML::Node& node, TimingConfig& t) {
    if (!node) return;
    t.rpc_timeout_ms = node["rpc_timeout_ms"].as<int>(t.rpc_timeout_ms);
    t.connect_timeout_ms = node["connect_timeout_ms"].as<int>(t.connect_timeout_ms);
    t.stop_timeout_ms = node["stop_timeout_ms"].as<int>(t.stop_timeout_ms);
    t.dispatch_max_attempts = node["dispatch_max_attempts"].as<int>(t.dispatch_max_attempts);
    t.dispatch_backoff_ms = node["dispatch_backoff_ms"].as<int>(t.dispatch_backoff_ms);
    t.checkpoint_interval_ms = node["checkpoint_interval_ms"].as<int>(t.checkpoint_interval_ms);
    t.checkpoint_max_failures = node["checkpoint_max_failures"].as<int>(t.checkpoint_max_failures);
    t.node_poll_interval_ms = node["node_poll_interval_ms"].as<int>(t.node_poll_interval_ms);
    t.plan_ttl_secs = node["plan_ttl_secs"].as<int64_t>(t.plan_ttl_secs);
    t.plan_wait_timeout_secs = node["plan_wait_timeout_secs"].as<int64_t>(t.plan_wait_timeout_secs);
    t.plan_poll_interval_ms = node["plan_poll_interval_ms"].as<int>(t.plan_poll_interval_ms);
    t.idempotency_retention_secs =
        node["idempotency_retention_secs"].as<int64_t>(t.idempotency_retention_secs);
    t.promote_after_secs = node["promote_after_secs"].as<int64_t>(t.promote_after_secs);
    t.housekeeping_interval_secs =
        node["housekeeping_interval_secs"].as<int64_t>(t.housekeeping_interval_secs);
    t.stream_queue_limit = node["stream_queue_limit"].as<std::size_t>(t.stream_queue_limit);
}

static NodeConfig parse_node(const YAML::Node& node, int default_concurrent, int default_depth) {
    NodeConfig n;
    n.id = node["id"].as<std::string>("");
    n.name = node["name"].as<std::string>(n.id);
    n.address = node["address"].as<std::string>(node["ip"].as<std::string>(""));
    n.port = node["port"].as<int>(n.port);
    n.user = node["user"].as<std::string>("");
    n.password = node["password"].as<std::string>("");
    n.max_concurrent = node["max_concurrent"].as<int>(default_concurrent);
    n.max_queue_depth = node["max_queue_depth"].as<int>(default_depth);
    return n;
}

static Result<void> validate(const Config& config) {
    if (config.listen().port < 1 || config.listen().port > 65535) {
        return Result<void>::Err(ErrorKind::InvalidRequest,
                                 fmt::format("listen.port out of range: {}", config.listen().port));
    }

    const auto& t = config.timings();
    if (t.rpc_timeout_ms <= 0 || t.stop_timeout_ms <= 0 || t.checkpoint_interval_ms <= 0 ||
        t.node_poll_interval_ms <= 0 || t.plan_poll_interval_ms <= 0) {
        return Result<void>::Err(ErrorKind::InvalidRequest, "timings: intervals must be positive");
    }
    if (t.dispatch_max_attempts < 1 || t.checkpoint_max_failures < 1) {
        return Result<void>::Err(ErrorKind::InvalidRequest, "timings: attempt counts must be >= 1");
    }

    std::set<std::string> seen;
    for (const auto& n : config.nodes()) {
        if (n.id.empty()) {
            return Result<void>::Err(ErrorKind::InvalidRequest, "nodes: every node needs an id");
        }
        if (!seen.insert(n.id).second) {
            return Result<void>::Err(ErrorKind::InvalidRequest,
                                     fmt::format("nodes: duplicate id '{}'", n.id));
        }
        if (n.address.empty()) {
            return Result<void>::Err(ErrorKind::InvalidRequest,
                                     fmt::format("nodes[{}].address is required", n.id));
        }
        if (n.port < 1 || n.port > 65535) {
            return Result<void>::Err(ErrorKind::InvalidRequest,
                                     fmt::format("nodes[{}].port out of range: {}", n.id, n.port));
        }
        if (n.max_concurrent < 1 || n.max_queue_depth < 1) {
            return Result<void>::Err(ErrorKind::InvalidRequest,
                                     fmt::format("nodes[{}]: limits must be >= 1", n.id));
        }
    }
    return Result<void>::Ok();
}

// ConfigBuilder is the friend that fills private members from YAML.
class ConfigBuilder {
public:
    static Result<Config> build(const YAML::Node& root) {
        Config c;
        try {
            parse_listen(root["listen"], c.listen_);
            parse_logging(root["logging"], c.logging_);
            parse_timings(root["timings"], c.timings_);

            if (root["policy"]) {
                c.policy_.require_plan_for_copy =
                    root["policy"]["require_plan_for_copy"].as<bool>(c.policy_.require_plan_for_copy);
            }
            if (root["storage"]) {
                c.db_path_ = root["storage"]["db_path"].as<std::string>(c.db_path_);
            }
            c.api_key_ = root["api_key"].as<std::string>("");

            int default_concurrent = DEFAULT_MAX_CONCURRENT;
            int default_depth = DEFAULT_MAX_QUEUE_DEPTH;
            if (root["defaults"]) {
                default_concurrent = root["defaults"]["max_concurrent"].as<int>(default_concurrent);
                default_depth = root["defaults"]["max_queue_depth"].as<int>(default_depth);
            }

            if (root["nodes"]) {
                if (!root["nodes"].IsSequence()) {
                    return Result<Config>::Err(ErrorKind::InvalidRequest, "nodes must be a list");
                }
                for (const auto& n : root["nodes"]) {
                    c.nodes_.push_back(parse_node(n, default_concurrent, default_depth));
                }
            }
        } catch (const YAML::Exception& e) {
            return Result<Config>::Err(ErrorKind::InvalidRequest,
                                       fmt::format("Invalid config: {}", e.what()));
        }

        auto valid = validate(c);
        if (valid.is_err()) return Result<Config>::Forward(valid);
        return Result<Config>::Ok(c);
    }
};

const NodeConfig* Config::find_node(const std::string& id) const {
    for (const auto& n : nodes_) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::InvalidRequest,
                                   fmt::format("Failed to parse config: {}", e.what()));
    }
    return ConfigBuilder::build(root);
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(ErrorKind::InvalidRequest,
                                   "Config file not found: " + path.string());
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::InvalidRequest,
                                   fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }

    auto result = ConfigBuilder::build(root);
    if (result.is_err()) return result;

    if (const char* db = std::getenv("HUB_DB_PATH")) {
        if (*db) result.value.db_path_ = db;
    }
    return result;
}

fs::path resolve_config_path(const std::string& cli_path) {
    if (!cli_path.empty()) return fs::path(cli_path);
    if (const char* env = std::getenv("HUB_CONFIG")) {
        if (*env) return fs::path(env);
    }
    return fs::current_path() / "rchub.yaml";
}
