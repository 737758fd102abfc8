#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <managers/cleanup_manager.hpp>

struct CliOptions {
    ScanSettings scan;                       // command-line layer of the scan settings
    std::optional<std::string> config_path;  // --config FILE
    bool write_config = false;
    bool yes = false;
    bool dry_run = false;
    bool no_color = false;
    bool help = false;
    bool version = false;
};

// Parse argv (without the program name).
Result<CliOptions> parse_args(const std::vector<std::string>& args);

std::string usage_text();

class DevstripCLI {
public:
    DevstripCLI();

    // Full interactive run. Returns the process exit status.
    int run(const CliOptions& opts);

private:
    Selection confirm(const Plan& plan);
    void show_progress(const CleanupProgress& p);

    bool animate_;
};
