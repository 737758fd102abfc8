#pragma once

#include <atomic>
#include <vector>
#include <core/types.hpp>
#include <scan/plan.hpp>
#include <scan/rule_catalog.hpp>

struct ScanResult {
    Plan plan;
    std::vector<Candidate> kept;         // protected by a keep-latest policy
    std::vector<Candidate> too_recent;   // modified within the minimum age (unsized)
    std::vector<ScanWarning> warnings;
    size_t discovered = 0;
    size_t directories_listed = 0;
    bool canceled = false;
};

// Drives one scan: walk, filter, size and plan.
//
// The walker runs on the calling thread. Every candidate old enough to be
// eligible is handed to a pool of `config.jobs` size workers as soon as it
// is found; the plan is built once all sizes are in. Retention ranks every
// discovered candidate of a category, recent ones included, so keep-latest
// always protects the newest entries on disk.
class Scanner {
public:
    Scanner(const RuleCatalog& catalog, const ScanConfig& config);

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    // Fails only for an invalid config. I/O problems end up in
    // ScanResult::warnings. `now` is the reference time for the age filter.
    Result<ScanResult> run(StatusCallback progress = nullptr,
                           TimePoint now = std::chrono::system_clock::now());

    // Stop walking and sizing as soon as possible. Safe from any thread.
    void cancel() { cancel_.store(true); }
    std::atomic<bool>& cancel_flag() { return cancel_; }

private:
    const RuleCatalog& catalog_;
    const ScanConfig& config_;
    std::atomic<bool> cancel_{false};
};
