#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <platform/platform.hpp>
#include "types.hpp"

namespace fs = std::filesystem;

// One layer of user settings (config file or command line). Unset fields
// defer to the layer below.
struct ScanSettings {
    std::vector<std::string> roots;
    std::vector<std::string> excludes;
    std::optional<long long> min_age_days;
    std::optional<long long> max_depth;
    std::optional<long long> keep_latest_derived;
    std::optional<long long> keep_latest_cache;
    std::optional<long long> jobs;
    bool all = false;   // min age 0, unlimited depth, keep nothing
};

class Config {
public:
    // Load ~/.devstrip/config.yaml. A missing file yields an empty Config.
    static Result<Config> load_global(const fs::path& home = platform::home_dir());

    // Load a specific file; it must exist.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and by tests).
    static Result<Config> parse(const std::string& yaml_text, const fs::path& source = "");

    const ScanSettings& settings() const { return settings_; }
    const fs::path& source() const { return source_; }

public:
    Config() = default;

private:
    ScanSettings settings_;
    fs::path source_;
};

// Get paths
fs::path get_global_config_dir(const fs::path& home = platform::home_dir());
fs::path get_global_config_path(const fs::path& home = platform::home_dir());
bool global_config_exists(const fs::path& home = platform::home_dir());

// Create default global config (never overwrites an existing file)
Result<void> create_default_global_config(const fs::path& home = platform::home_dir());

// Directories under `home` scanned by default: Projects, workspace, Work and
// Developer, whichever exist as directories.
std::vector<fs::path> default_roots(const fs::path& home);

// Combine built-in defaults, the config file and the command line into a
// validated ScanConfig. Later layers win. Roots are the current directory,
// default_roots(home) and every explicitly named root, canonicalized and
// deduplicated; explicit roots must exist.
Result<ScanConfig> build_scan_config(const ScanSettings& file, const ScanSettings& cli,
                                     const fs::path& home, const fs::path& cwd);

// Structural checks on a ScanConfig: absolute roots and excludes,
// non-negative counts, bounded min age, 1..MAX_JOBS workers.
Result<void> validate_scan_config(const ScanConfig& config);
