#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include "time_utils.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <climits>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// ── YAML helpers ──────────────────────────────────────────────

// Read an optional non-negative integer key. Junk or negative values are errors.
static Result<void> read_count(const YAML::Node& root, const char* key,
                               std::optional<long long>& out) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return Result<void>::Ok();
    }
    if (!node.IsScalar()) {
        return Result<void>::Err(fmt::format("'{}' must be a number", key));
    }
    auto parsed = parse_non_negative(node.Scalar(), key, LLONG_MAX);
    if (parsed.is_err()) {
        return Result<void>::Err(parsed.error);
    }
    out = parsed.value;
    return Result<void>::Ok();
}

// A key may hold a single path or a list of paths.
static Result<void> read_paths(const YAML::Node& root, const char* key,
                               std::vector<std::string>& out) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return Result<void>::Ok();
    }
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                return Result<void>::Err(fmt::format("'{}' entries must be paths", key));
            }
            out.push_back(item.as<std::string>());
        }
    } else {
        return Result<void>::Err(fmt::format("'{}' must be a path or a list of paths", key));
    }
    return Result<void>::Ok();
}

// ── Loading ───────────────────────────────────────────────────

Result<Config> Config::parse(const std::string& yaml_text, const fs::path& source) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config {}: {}",
                                               source.string(), e.what()));
    }

    Config config;
    config.source_ = source;

    // An empty document is a valid, empty config
    if (!root || root.IsNull()) {
        return Result<Config>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<Config>::Err(fmt::format("Config {} must be a mapping", source.string()));
    }

    auto& s = config.settings_;
    std::vector<Result<void>> checks = {
        read_paths(root, "roots", s.roots),
        read_paths(root, "exclude", s.excludes),
        read_count(root, "min_age_days", s.min_age_days),
        read_count(root, "max_depth", s.max_depth),
        read_count(root, "keep_latest_derived", s.keep_latest_derived),
        read_count(root, "keep_latest_cache", s.keep_latest_cache),
        read_count(root, "jobs", s.jobs),
    };
    for (const auto& check : checks) {
        if (check.is_err()) {
            return Result<Config>::Err(fmt::format("Invalid config {}: {}",
                                                   source.string(), check.error));
        }
    }

    devstrip_log(fmt::format("Loaded config {} ({} roots, {} excludes)",
                             source.string(), s.roots.size(), s.excludes.size()));
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str(), path);
}

Result<Config> Config::load_global(const fs::path& home) {
    if (!global_config_exists(home)) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_global_config_path(home));
}

bool global_config_exists(const fs::path& home) {
    std::error_code ec;
    return fs::is_regular_file(get_global_config_path(home), ec);
}

fs::path get_global_config_dir(const fs::path& home) {
    return home / CONFIG_DIR_NAME;
}

fs::path get_global_config_path(const fs::path& home) {
    return get_global_config_dir(home) / CONFIG_FILE_NAME;
}

Result<void> create_default_global_config(const fs::path& home) {
    fs::path config_path = get_global_config_path(home);

    // Don't overwrite existing config
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Failed to create {}: {}",
                                             config_path.parent_path().string(), ec.message()));
    }

    const std::string default_config = fmt::format(R"(# devstrip configuration
# Command-line options override every value below.

# Extra directories to scan, on top of the current directory and
# ~/Projects, ~/workspace, ~/Work and ~/Developer.
roots: []

# Paths that are never reported or deleted.
exclude: []

# Skip anything modified within this many days.
min_age_days: {}

# Directory levels below each root to search.
max_depth: {}

# Newest Xcode DerivedData / Archives entries to keep.
keep_latest_derived: {}

# Newest Homebrew cache entries to keep.
keep_latest_cache: {}

# Worker threads for sizing and deletion (defaults to the CPU count).
# jobs: 4
)", DEFAULT_MIN_AGE_DAYS, DEFAULT_MAX_DEPTH, DEFAULT_KEEP_LATEST_DERIVED,
    DEFAULT_KEEP_LATEST_CACHE);

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    out.close();
    if (!out) {
        return Result<void>::Err("Failed to write config file " + config_path.string());
    }
    return Result<void>::Ok();
}

// ── Scan configuration ────────────────────────────────────────

std::vector<fs::path> default_roots(const fs::path& home) {
    std::vector<fs::path> roots;
    if (home.empty()) {
        return roots;
    }
    for (const char* name : DEFAULT_HOME_PROJECT_DIRS) {
        fs::path dir = home / name;
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            roots.push_back(dir);
        }
    }
    return roots;
}

static fs::path resolve_user_path(const std::string& raw, const fs::path& home,
                                  const fs::path& cwd) {
    fs::path p = expand_user_path(raw, home);
    if (p.is_relative()) {
        p = cwd / p;
    }
    return canonical_or_self(p);
}

static void add_unique(std::vector<fs::path>& paths, const fs::path& p) {
    if (std::find(paths.begin(), paths.end(), p) == paths.end()) {
        paths.push_back(p);
    }
}

static int clamp_int(long long v) {
    return v > INT_MAX ? INT_MAX : static_cast<int>(v);
}

Result<ScanConfig> build_scan_config(const ScanSettings& file, const ScanSettings& cli,
                                     const fs::path& home, const fs::path& cwd) {
    ScanConfig config;

    // ── Excludes: union of both layers ──
    for (const auto* layer : {&file, &cli}) {
        for (const auto& raw : layer->excludes) {
            if (raw.empty()) continue;
            add_unique(config.excludes, resolve_user_path(raw, home, cwd));
        }
    }

    // ── Roots ──
    std::vector<fs::path> implicit;
    if (!cwd.empty()) implicit.push_back(cwd);
    for (const auto& r : default_roots(home)) implicit.push_back(r);

    for (const auto& r : implicit) {
        std::error_code ec;
        if (!fs::is_directory(r, ec)) continue;
        fs::path canon = canonical_or_self(r);
        if (is_excluded(canon, config.excludes)) {
            devstrip_log("Skipping excluded default root " + canon.string());
            continue;
        }
        add_unique(config.roots, canon);
    }

    for (const auto* layer : {&file, &cli}) {
        for (const auto& raw : layer->roots) {
            if (raw.empty()) continue;
            fs::path p = resolve_user_path(raw, home, cwd);
            std::error_code ec;
            if (!fs::exists(p, ec)) {
                return Result<ScanConfig>::Err("Root does not exist: " + p.string());
            }
            if (!fs::is_directory(p, ec)) {
                return Result<ScanConfig>::Err("Root is not a directory: " + p.string());
            }
            if (is_excluded(p, config.excludes)) {
                devstrip_log("Skipping excluded root " + p.string());
                continue;
            }
            add_unique(config.roots, p);
        }
    }

    // ── Numbers: defaults < file < command line ──
    auto pick = [](const std::optional<long long>& cli_value,
                   const std::optional<long long>& file_value, long long fallback) {
        if (cli_value) return *cli_value;
        if (file_value) return *file_value;
        return fallback;
    };

    long long min_age_days = pick(cli.min_age_days, file.min_age_days, DEFAULT_MIN_AGE_DAYS);
    if (min_age_days > MAX_MIN_AGE_DAYS) {
        return Result<ScanConfig>::Err(fmt::format("min_age_days must be at most {}",
                                                   MAX_MIN_AGE_DAYS));
    }
    config.min_age = days(min_age_days);
    // At least one level below each root is always listed
    config.max_depth = std::max(1, clamp_int(pick(cli.max_depth, file.max_depth,
                                                  DEFAULT_MAX_DEPTH)));
    config.keep_latest_derived = clamp_int(pick(cli.keep_latest_derived, file.keep_latest_derived,
                                                DEFAULT_KEEP_LATEST_DERIVED));
    config.keep_latest_cache = clamp_int(pick(cli.keep_latest_cache, file.keep_latest_cache,
                                              DEFAULT_KEEP_LATEST_CACHE));
    config.jobs = clamp_int(pick(cli.jobs, file.jobs,
                                 std::min(platform::hardware_threads(), MAX_JOBS)));

    if (cli.all) {
        config.min_age = std::chrono::seconds(0);
        config.max_depth = INT_MAX;
        config.keep_latest_derived = 0;
        config.keep_latest_cache = 0;
    }

    auto valid = validate_scan_config(config);
    if (valid.is_err()) {
        return Result<ScanConfig>::Err(valid.error);
    }

    devstrip_log(fmt::format("Scan config: {} roots, {} excludes, min_age={}s, max_depth={}, "
                             "keep_derived={}, keep_cache={}, jobs={}",
                             config.roots.size(), config.excludes.size(),
                             config.min_age.count(), config.max_depth,
                             config.keep_latest_derived, config.keep_latest_cache, config.jobs));
    return Result<ScanConfig>::Ok(config);
}

Result<void> validate_scan_config(const ScanConfig& config) {
    for (const auto& root : config.roots) {
        if (!root.is_absolute()) {
            return Result<void>::Err("Root must be an absolute path: " + root.string());
        }
    }
    for (const auto& ex : config.excludes) {
        if (!ex.is_absolute()) {
            return Result<void>::Err("Exclude must be an absolute path: " + ex.string());
        }
    }
    if (config.min_age.count() < 0) {
        return Result<void>::Err("min_age_days must not be negative");
    }
    if (config.min_age.count() > MAX_MIN_AGE_DAYS * SECONDS_PER_DAY) {
        return Result<void>::Err(fmt::format("min_age_days must be at most {}", MAX_MIN_AGE_DAYS));
    }
    if (config.max_depth < 0) {
        return Result<void>::Err("max_depth must not be negative");
    }
    if (config.keep_latest_derived < 0 || config.keep_latest_cache < 0) {
        return Result<void>::Err("keep-latest counts must not be negative");
    }
    if (config.jobs < 1 || config.jobs > MAX_JOBS) {
        return Result<void>::Err(fmt::format("jobs must be between 1 and {}", MAX_JOBS));
    }
    return Result<void>::Ok();
}
