#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from the given YAML file. A missing file yields the defaults;
    // a file that exists but does not parse is an error.
    static Result<Config> load(const fs::path& path);

    // Load from <ego root>/config.yaml
    static Result<Config> load_global();

    // Accessors
    const fs::path& state_dir() const { return state_dir_; }
    const ScanPolicy& scan_policy() const { return scan_policy_; }
    const fs::path& source_path() const { return source_path_; }

    Config();

private:
    fs::path state_dir_;
    ScanPolicy scan_policy_;
    fs::path source_path_;    // empty when running on defaults
};

// <ego root>/config.yaml
fs::path get_global_config_path();
