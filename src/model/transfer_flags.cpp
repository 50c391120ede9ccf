#include "transfer_flags.hpp"
#include "job.hpp"
#include <fmt/format.h>
#include <cctype>

using json = nlohmann::json;

bool is_valid_bwlimit(const std::string& value) {
    if (value == "off") return true;
    if (value.empty()) return false;

    size_t i = 0;
    bool digits = false;
    bool dot = false;
    for (; i < value.size(); ++i) {
        char c = value[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits = true;
        } else if (c == '.' && !dot && digits) {
            dot = true;
        } else {
            break;
        }
    }
    if (!digits || value[i - 1] == '.') return false;
    if (i == value.size()) return true;
    if (i + 1 != value.size()) return false;

    char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(value[i])));
    return suffix == 'B' || suffix == 'K' || suffix == 'M' || suffix == 'G' ||
           suffix == 'T' || suffix == 'P';
}

static Result<bool> read_bool(const json& v, const std::string& key) {
    if (!v.is_boolean()) {
        return Result<bool>::Err(ErrorKind::InvalidRequest,
                                 fmt::format("flag '{}' must be a boolean", key));
    }
    return Result<bool>::Ok(v.get<bool>());
}

static Result<int> read_int(const json& v, const std::string& key, int lo, int hi) {
    if (!v.is_number_integer()) {
        return Result<int>::Err(ErrorKind::InvalidRequest,
                                fmt::format("flag '{}' must be an integer", key));
    }
    auto n = v.get<int64_t>();
    if (n < lo || n > hi) {
        return Result<int>::Err(ErrorKind::InvalidRequest,
                                fmt::format("flag '{}' must be in {}..{}", key, lo, hi));
    }
    return Result<int>::Ok(static_cast<int>(n));
}

Result<TransferFlags> TransferFlags::from_json(const json& j, JobKind kind) {
    TransferFlags f;
    if (j.is_null()) return Result<TransferFlags>::Ok(f);
    if (!j.is_object()) {
        return Result<TransferFlags>::Err(ErrorKind::InvalidRequest, "flags must be an object");
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& v = it.value();

        if (key == "checksum" || key == "sizeOnly" || key == "ignoreExisting" ||
            key == "fastList" || key == "createEmptySrcDirs" || key == "deleteEmptySrcDirs") {
            auto b = read_bool(v, key);
            if (b.is_err()) return Result<TransferFlags>::Forward(b);
            if (key == "checksum") f.checksum = b.value;
            else if (key == "sizeOnly") f.size_only = b.value;
            else if (key == "ignoreExisting") f.ignore_existing = b.value;
            else if (key == "fastList") f.fast_list = b.value;
            else if (key == "createEmptySrcDirs") f.create_empty_src_dirs = b.value;
            else f.delete_empty_src_dirs = b.value;
        } else if (key == "transfers") {
            auto n = read_int(v, key, 1, 64);
            if (n.is_err()) return Result<TransferFlags>::Forward(n);
            f.transfers = n.value;
        } else if (key == "checkers") {
            auto n = read_int(v, key, 1, 256);
            if (n.is_err()) return Result<TransferFlags>::Forward(n);
            f.checkers = n.value;
        } else if (key == "bwlimit") {
            if (!v.is_string() || !is_valid_bwlimit(v.get<std::string>())) {
                return Result<TransferFlags>::Err(ErrorKind::InvalidRequest,
                                                  "flag 'bwlimit' must be 'off' or a rate like '10M'");
            }
            f.bwlimit = v.get<std::string>();
        } else if (key == "dryRun") {
            return Result<TransferFlags>::Err(ErrorKind::InvalidRequest,
                                              "dryRun is not a flag; use POST /v1/jobs/plan");
        } else {
            return Result<TransferFlags>::Err(ErrorKind::InvalidRequest,
                                              fmt::format("unknown flag '{}'", key));
        }
    }

    if (f.checksum.value_or(false) && f.size_only.value_or(false)) {
        return Result<TransferFlags>::Err(ErrorKind::InvalidRequest,
                                          "flags 'checksum' and 'sizeOnly' are mutually exclusive");
    }
    if (f.delete_empty_src_dirs.has_value() && kind != JobKind::Move) {
        return Result<TransferFlags>::Err(ErrorKind::InvalidRequest,
                                          "flag 'deleteEmptySrcDirs' only applies to move");
    }
    return Result<TransferFlags>::Ok(f);
}

json TransferFlags::to_json() const {
    json j = json::object();
    if (checksum) j["checksum"] = *checksum;
    if (size_only) j["sizeOnly"] = *size_only;
    if (ignore_existing) j["ignoreExisting"] = *ignore_existing;
    if (fast_list) j["fastList"] = *fast_list;
    if (transfers) j["transfers"] = *transfers;
    if (checkers) j["checkers"] = *checkers;
    if (bwlimit) j["bwlimit"] = *bwlimit;
    if (create_empty_src_dirs) j["createEmptySrcDirs"] = *create_empty_src_dirs;
    if (delete_empty_src_dirs) j["deleteEmptySrcDirs"] = *delete_empty_src_dirs;
    return j;
}

void TransferFlags::apply_to_rc(json& payload) const {
    json config = payload.contains("_config") ? payload["_config"] : json::object();
    if (checksum) config["CheckSum"] = *checksum;
    if (size_only) config["SizeOnly"] = *size_only;
    if (ignore_existing) config["IgnoreExisting"] = *ignore_existing;
    if (fast_list) config["UseListR"] = *fast_list;
    if (transfers) config["Transfers"] = *transfers;
    if (checkers) config["Checkers"] = *checkers;
    if (bwlimit) config["BwLimit"] = *bwlimit;
    if (!config.empty()) payload["_config"] = config;

    if (create_empty_src_dirs) payload["createEmptySrcDirs"] = *create_empty_src_dirs;
    if (delete_empty_src_dirs) payload["deleteEmptySrcDirs"] = *delete_empty_src_dirs;
}
