#include "config.hpp"
#include "constants.hpp"
#include "directory_structure.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>

namespace fs = std::filesystem;

// Accepts "rs", ".RS", "  Rs " → "rs". Returns empty for unusable input.
static std::string normalize_extension(std::string ext) {
    trim(ext);
    while (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    if (ext.find('/') != std::string::npos) return "";
    return to_lower(ext);
}

// "~/x" → $HOME/x; relative paths are taken relative to the config file.
static fs::path resolve_config_path(const std::string& raw, const fs::path& base_dir) {
    if (raw == "~") return platform::home_dir();
    if (raw.rfind("~/", 0) == 0) {
        return platform::home_dir() / raw.substr(2);
    }
    fs::path p(raw);
    if (p.is_relative()) p = base_dir / p;
    return p.lexically_normal();
}

static ScanPolicy parse_scan_policy(const YAML::Node& root) {
    ScanPolicy policy;
    policy.include_hidden = root["include_hidden"].as<bool>(true);

    auto threads = root["scan_threads"].as<int>(0);
    policy.threads = std::clamp(threads, 0, MAX_SCAN_THREADS);

    // extra_extensions: accept a single string or a list
    auto ext_node = root["extra_extensions"];
    std::vector<std::string> raw;
    if (ext_node) {
        if (ext_node.IsSequence()) {
            raw = ext_node.as<std::vector<std::string>>(std::vector<std::string>());
        } else if (ext_node.IsScalar()) {
            raw.push_back(ext_node.as<std::string>());
        }
    }
    for (auto& ext : raw) {
        auto norm = normalize_extension(ext);
        if (norm.empty()) continue;
        if (std::find(policy.extra_extensions.begin(), policy.extra_extensions.end(), norm)
                == policy.extra_extensions.end()) {
            policy.extra_extensions.push_back(norm);
        }
    }
    return policy;
}

Config::Config() : state_dir_(get_default_state_dir()) {}

fs::path get_global_config_path() {
    return get_ego_root() / CONFIG_FILE_NAME;
}

Result<Config> Config::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Ok(Config());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        config.source_path_ = path;

        // An empty file parses as a null node; keep the defaults
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config at " + path.string() + " must be a mapping");
        }

        auto state_dir = root["state_dir"].as<std::string>("");
        trim(state_dir);
        if (!state_dir.empty()) {
            config.state_dir_ = resolve_config_path(state_dir, path.parent_path());
        }

        config.scan_policy_ = parse_scan_policy(root);

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_global() {
    return load(get_global_config_path());
}
