#include "scanner.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <scan/filters.hpp>
#include <scan/size_estimator.hpp>
#include <scan/tree_walker.hpp>
#include <scan/warning_sink.hpp>
#include <util/worker_pool.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <mutex>

Scanner::Scanner(const RuleCatalog& catalog, const ScanConfig& config)
    : catalog_(catalog), config_(config) {}

Result<ScanResult> Scanner::run(StatusCallback progress, TimePoint now) {
    auto valid = validate_scan_config(config_);
    if (valid.is_err()) {
        return Result<ScanResult>::Err(valid.error);
    }

    ScanResult result;
    WarningSink warnings;
    TreeWalker walker(catalog_, config_, warnings, &cancel_);
    walker.set_progress(progress);

    std::mutex sized_mutex;
    std::vector<Candidate> sized;
    std::vector<Candidate> recent;

    {
        WorkerPool pool(static_cast<size_t>(config_.jobs));

        while (auto found = walker.next()) {
            result.discovered++;
            Candidate candidate = std::move(*found);

            if (is_excluded(candidate.path, config_.excludes)) {
                continue;
            }
            if (!is_eligible(candidate, config_.min_age, config_.excludes, now)) {
                recent.push_back(std::move(candidate));
                continue;
            }

            pool.submit([this, c = std::move(candidate), &warnings, &sized, &sized_mutex]() mutable {
                auto size = size_of(c.path, warnings, &cancel_);
                if (size.is_err()) {
                    warnings.warn(c.path, size.error);
                    return;
                }
                c.size_bytes = size.value;
                std::lock_guard<std::mutex> lock(sized_mutex);
                sized.push_back(std::move(c));
            });
        }

        pool.wait_idle();
    }

    result.directories_listed = walker.directories_listed();
    result.canceled = cancel_.load();

    // Rank everything that was found; only sized entries can be planned.
    std::vector<Candidate> all = std::move(sized);
    all.insert(all.end(), std::make_move_iterator(recent.begin()),
               std::make_move_iterator(recent.end()));
    auto retention = apply_retention(std::move(all), config_);

    std::vector<Candidate> planned;
    for (auto& c : retention.removable) {
        if (c.size_bytes.has_value()) {
            planned.push_back(std::move(c));
        } else {
            result.too_recent.push_back(std::move(c));
        }
    }
    std::sort(result.too_recent.begin(), result.too_recent.end(),
              [](const Candidate& a, const Candidate& b) { return a.path < b.path; });

    result.kept = std::move(retention.kept);
    result.plan = build_plan(std::move(planned));
    result.warnings = warnings.drain();

    devstrip_log(fmt::format("Scan {}: discovered={} planned={} bytes={} kept={} recent={} "
                             "warnings={} dirs_listed={}",
                             result.canceled ? "canceled" : "done",
                             result.discovered, result.plan.size(), result.plan.total_bytes(),
                             result.kept.size(), result.too_recent.size(),
                             result.warnings.size(), result.directories_listed));
    return Result<ScanResult>::Ok(std::move(result));
}
