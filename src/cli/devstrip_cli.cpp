#include "devstrip_cli.hpp"
#include "report.hpp"
#include "spinner.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <scan/rule_catalog.hpp>
#include <scan/scanner.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <climits>
#include <cstdlib>
#include <iostream>

// ── Argument parsing ────────────────────────────────────────

static bool is_option(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    CliOptions opts;

    auto value_of = [&](size_t& i, const std::string& flag) -> Result<std::string> {
        if (i + 1 >= args.size()) {
            return Result<std::string>::Err(flag + " requires a value");
        }
        return Result<std::string>::Ok(args[++i]);
    };

    auto number_of = [&](size_t& i, const std::string& flag,
                         std::optional<long long>& out) -> Result<void> {
        auto raw = value_of(i, flag);
        if (raw.is_err()) return Result<void>::Err(raw.error);
        auto n = parse_non_negative(raw.value, flag, INT_MAX);
        if (n.is_err()) return Result<void>::Err(n.error);
        out = n.value;
        return Result<void>::Ok();
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        Result<void> step = Result<void>::Ok();

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "--roots") {
            // Takes every following value up to the next option
            size_t before = opts.scan.roots.size();
            while (i + 1 < args.size() && !is_option(args[i + 1])) {
                opts.scan.roots.push_back(args[++i]);
            }
            if (opts.scan.roots.size() == before) {
                step = Result<void>::Err("--roots requires at least one path");
            }
        } else if (arg == "-x" || arg == "--exclude") {
            auto v = value_of(i, arg);
            if (v.is_err()) step = Result<void>::Err(v.error);
            else opts.scan.excludes.push_back(v.value);
        } else if (arg == "--min-age-days") {
            step = number_of(i, arg, opts.scan.min_age_days);
        } else if (arg == "--max-depth") {
            step = number_of(i, arg, opts.scan.max_depth);
        } else if (arg == "--keep-latest-derived") {
            step = number_of(i, arg, opts.scan.keep_latest_derived);
        } else if (arg == "--keep-latest-cache") {
            step = number_of(i, arg, opts.scan.keep_latest_cache);
        } else if (arg == "-j" || arg == "--jobs") {
            step = number_of(i, arg, opts.scan.jobs);
        } else if (arg == "-y" || arg == "--yes") {
            opts.yes = true;
        } else if (arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "--no-color") {
            opts.no_color = true;
        } else if (arg == "-a" || arg == "--all") {
            opts.scan.all = true;
        } else if (arg == "--config") {
            auto v = value_of(i, arg);
            if (v.is_err()) step = Result<void>::Err(v.error);
            else opts.config_path = v.value;
        } else if (arg == "--write-config") {
            opts.write_config = true;
        } else if (arg == "--") {
            for (++i; i < args.size(); ++i) opts.scan.roots.push_back(args[i]);
        } else if (is_option(arg)) {
            step = Result<void>::Err("Unknown option: " + arg);
        } else {
            opts.scan.roots.push_back(arg);
        }

        if (step.is_err()) {
            return Result<CliOptions>::Err(step.error);
        }
    }
    return Result<CliOptions>::Ok(opts);
}

std::string usage_text() {
    std::string out = theme::banner();
    out += theme::section("Usage");
    out += "    " + theme::blue("devstrip") + " " + theme::brown("[OPTIONS] [PATH...]") + "\n";
    out += theme::section("Options");

    const std::pair<const char*, const char*> rows[] = {
        {"--roots PATH...",          "Extra directories to scan"},
        {"-x, --exclude PATH",       "Never touch PATH or anything below it"},
        {"--min-age-days N",         "Skip entries modified in the last N days (default 2)"},
        {"--max-depth N",            "Directory levels searched below each root (default 5)"},
        {"--keep-latest-derived N",  "Newest DerivedData/Archives kept (default 1)"},
        {"--keep-latest-cache N",    "Newest Homebrew downloads kept (default 1)"},
        {"-j, --jobs N",             "Worker threads (default: CPU count)"},
        {"-y, --yes",                "Delete without asking"},
        {"--dry-run",                "Report only"},
        {"--no-color",               "Plain output"},
        {"-a, --all",                "Ignore age, depth and keep-latest limits"},
        {"--config FILE",            "Read settings from FILE"},
        {"--write-config",           "Create ~/.devstrip/config.yaml"},
        {"--version",                "Show version"},
        {"-h, --help",               "Show this help"},
    };
    for (const auto& [flag, help] : rows) {
        out += "    " + theme::blue(fmt::format("{:<26}", flag)) + theme::dim(help) + "\n";
    }
    out += "\n";
    return out;
}

// ── Interactive run ─────────────────────────────────────────

DevstripCLI::DevstripCLI()
    : animate_(platform::stdout_is_terminal()) {}

Selection DevstripCLI::confirm(const Plan& plan) {
    for (;;) {
        std::cout << theme::bold(fmt::format(
            "Type yes to delete all {} item(s), or item numbers like 1,3-5 [yes/N]: ",
            plan.size())) << std::flush;

        std::string line;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            return Selection{};
        }
        auto selection = parse_selection(line, plan.size());
        if (selection) {
            return *selection;
        }
        std::cout << theme::fail(fmt::format("Not understood: '{}'. Items run from 1 to {}.",
                                             StringUtils::trim(line), plan.size()));
    }
}

void DevstripCLI::show_progress(const CleanupProgress& p) {
    const std::string path = p.outcome.candidate.path.string();
    if (animate_) {
        std::string bar = render_progress_bar(p.completed, p.total, PROGRESS_BAR_WIDTH);
        std::string prefix = fmt::format("Cleaning [{}] {}/{} ", bar, p.completed, p.total);
        int room = std::max(20, platform::term_width() - static_cast<int>(prefix.size()) - 1);
        std::string line = prefix + truncate_middle(path, static_cast<size_t>(room));
        std::cout << "\r" << line << "\033[K" << std::flush;
    } else {
        std::cout << fmt::format("Cleaning {}/{}: {}\n", p.completed, p.total, path);
    }
}

int DevstripCLI::run(const CliOptions& opts) {
    bool color = !opts.no_color && platform::stdout_is_terminal() && !std::getenv("NO_COLOR");
    theme::set_colors(color);

    if (opts.help) {
        std::cout << usage_text();
        return 0;
    }
    if (opts.version) {
        std::cout << theme::bold("devstrip") << theme::dim(fmt::format(" version {}", DEVSTRIP_VERSION))
                  << "\n";
        return 0;
    }

    const fs::path home = platform::home_dir();

    if (opts.write_config) {
        bool existed = global_config_exists(home);
        auto created = create_default_global_config(home);
        if (created.is_err()) {
            std::cout << theme::fail(created.error);
            return 1;
        }
        std::string path = get_global_config_path(home).string();
        std::cout << (existed ? theme::info("Config already exists: " + path)
                              : theme::ok("Wrote " + path));
        return 0;
    }

    // ── Configuration ──
    auto file = opts.config_path ? Config::load_file(expand_user_path(*opts.config_path, home))
                                 : Config::load_global(home);
    if (file.is_err()) {
        std::cout << theme::fail(file.error);
        return 1;
    }

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) cwd.clear();

    auto config = build_scan_config(file.value.settings(), opts.scan, home, cwd);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return 1;
    }

    // ── Scan ──
    RuleCatalog catalog = RuleCatalog::standard(home);
    Scanner scanner(catalog, config.value);
    auto now = std::chrono::system_clock::now();

    platform::set_interrupt_flag(&scanner.cancel_flag());
    Spinner spinner(animate_);
    spinner.start("Scanning for cleanup candidates");
    auto scan = scanner.run([&spinner](const std::string& msg) { spinner.update(msg); }, now);
    spinner.stop();
    platform::set_interrupt_flag(nullptr);

    if (scan.is_err()) {
        std::cout << theme::fail(scan.error);
        return 1;
    }
    const ScanResult& result = scan.value;

    if (result.canceled) {
        std::cout << format_warnings(result.warnings);
        std::cout << theme::fail("Scan interrupted; nothing was deleted.");
        return 1;
    }

    if (!result.kept.empty()) {
        std::cout << format_kept(result.kept, now);
    }
    std::cout << format_skipped_recent(result.too_recent, config.value.min_age);

    if (result.plan.empty()) {
        std::cout << format_warnings(result.warnings);
        std::cout << theme::info("No safe cleanup targets were found.");
        return 0;
    }

    std::cout << theme::section("Cleanup candidates");
    std::cout << format_plan_report(result.plan);
    std::cout << format_warnings(result.warnings);
    std::cout << "\n";

    if (opts.dry_run) {
        std::cout << theme::info("Dry-run: no files will be removed.");
        return 0;
    }

    // ── Cleanup ──
    CleanupManager cleanup(config.value.jobs);
    auto report = cleanup.execute(
        result.plan,
        [this, &opts](const Plan& plan) {
            return opts.yes ? Selection{true, {}} : confirm(plan);
        },
        [this](const CleanupProgress& p) { show_progress(p); });

    if (!report) {
        std::cout << theme::info("Cleanup aborted.");
        return 0;
    }
    if (animate_) {
        std::cout << "\n";
    }

    std::cout << format_deletion_summary(*report);
    return report->has_failures() ? 1 : 0;
}
