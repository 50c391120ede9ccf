#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <core/types.hpp>

enum class JobKind;

// Transfer options accepted from clients. Every key is enumerated and range
// checked here; nothing reaches the agent RPC layer unvalidated.
//
//   key                  type            absent means                   agent field
//   checksum             bool            compare size + modtime         _config.CheckSum
//   sizeOnly             bool            compare size + modtime         _config.SizeOnly
//   ignoreExisting       bool            existing files are compared    _config.IgnoreExisting
//   fastList             bool            per-directory listing          _config.UseListR
//   transfers            int 1..64       agent default (4)              _config.Transfers
//   checkers             int 1..256      agent default (8)              _config.Checkers
//   bwlimit              "off" | N[KMGT] unlimited                      _config.BwLimit
//   createEmptySrcDirs   bool            empty dirs not created         createEmptySrcDirs
//   deleteEmptySrcDirs   bool (move)     empty source dirs kept         deleteEmptySrcDirs
struct TransferFlags {
    std::optional<bool> checksum;
    std::optional<bool> size_only;
    std::optional<bool> ignore_existing;
    std::optional<bool> fast_list;
    std::optional<int> transfers;
    std::optional<int> checkers;
    std::optional<std::string> bwlimit;
    std::optional<bool> create_empty_src_dirs;
    std::optional<bool> delete_empty_src_dirs;

    // Parse and validate client flags for a given operation kind. A null or
    // missing value is an empty flag set.
    static Result<TransferFlags> from_json(const nlohmann::json& j, JobKind kind);

    // Client-facing form: only explicitly set keys. Keys are sorted, so
    // dump() of this is the canonical form used for binding and fingerprints.
    nlohmann::json to_json() const;
    std::string canonical() const { return to_json().dump(); }

    // Add the agent-side fields to an rc operation payload.
    void apply_to_rc(nlohmann::json& payload) const;

    bool operator==(const TransferFlags& other) const { return canonical() == other.canonical(); }
    bool operator!=(const TransferFlags& other) const { return !(*this == other); }
};

// "off", "10M", "1.5G", "512" (bytes/s as rclone reads it).
bool is_valid_bwlimit(const std::string& value);
