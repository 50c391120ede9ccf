#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file. HUB_DB_PATH overrides storage.db_path.
    static Result<Config> load(const fs::path& path);

    // Parse YAML text (no environment overrides).
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const ListenConfig& listen() const { return listen_; }
    const LoggingConfig& logging() const { return logging_; }
    const TimingConfig& timings() const { return timings_; }
    const PolicyConfig& policy() const { return policy_; }
    const std::vector<NodeConfig>& nodes() const { return nodes_; }
    const std::string& api_key() const { return api_key_; }
    const std::string& db_path() const { return db_path_; }

    const NodeConfig* find_node(const std::string& id) const;

    // Programmatic construction (tests, embedding)
    void set_db_path(const std::string& path) { db_path_ = path; }
    void set_api_key(const std::string& key) { api_key_ = key; }
    void add_node(const NodeConfig& node) { nodes_.push_back(node); }
    TimingConfig& mutable_timings() { return timings_; }
    PolicyConfig& mutable_policy() { return policy_; }

public:
    Config() = default;

private:
    ListenConfig listen_;
    LoggingConfig logging_;
    TimingConfig timings_;
    PolicyConfig policy_;
    std::vector<NodeConfig> nodes_;
    std::string api_key_;
    std::string db_path_ = "rchub.db";

    friend class ConfigBuilder;
};

// Resolve the config file: explicit argument, then HUB_CONFIG, then ./rchub.yaml
fs::path resolve_config_path(const std::string& cli_path);
