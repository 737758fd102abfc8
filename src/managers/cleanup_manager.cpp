#include "cleanup_manager.hpp"
#include <core/log.hpp>
#include <util/worker_pool.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <mutex>

CleanupManager::CleanupManager(int jobs)
    : jobs_(std::max(1, jobs)) {}

DeletionOutcome CleanupManager::remove_one(const Candidate& candidate) {
    DeletionOutcome outcome;
    outcome.candidate = candidate;

    std::error_code ec;
    auto status = fs::symlink_status(candidate.path, ec);
    if (ec || !fs::exists(status)) {
        outcome.error = ec && ec != std::errc::no_such_file_or_directory
            ? ec.message()
            : "path no longer exists";
        return outcome;
    }

    fs::remove_all(candidate.path, ec);
    if (ec) {
        outcome.error = ec.message();
        return outcome;
    }

    outcome.success = true;
    return outcome;
}

DeletionReport CleanupManager::remove(const std::vector<Candidate>& approved,
                                      CleanupCallback cb) {
    DeletionReport report;
    report.outcomes.resize(approved.size());
    if (approved.empty()) {
        return report;
    }

    std::mutex progress_mutex;
    size_t completed = 0;

    auto run_one = [&](size_t i) {
        DeletionOutcome outcome = remove_one(approved[i]);
        if (outcome.success) {
            devstrip_log("Removed " + outcome.candidate.path.string());
        } else {
            devstrip_log(fmt::format("Failed to remove {}: {}",
                                     outcome.candidate.path.string(), outcome.error));
        }

        std::lock_guard<std::mutex> lock(progress_mutex);
        report.outcomes[i] = std::move(outcome);
        ++completed;
        if (cb) cb(CleanupProgress{completed, approved.size(), report.outcomes[i]});
    };

    size_t workers = std::min(approved.size(), static_cast<size_t>(jobs_));
    if (workers <= 1) {
        for (size_t i = 0; i < approved.size(); ++i) run_one(i);
    } else {
        WorkerPool pool(workers);
        for (size_t i = 0; i < approved.size(); ++i) {
            pool.submit([&run_one, i] { run_one(i); });
        }
        pool.wait_idle();
    }

    for (const auto& o : report.outcomes) {
        if (o.success) report.bytes_freed += o.candidate.bytes();
    }

    devstrip_log(fmt::format("Cleanup done: {} removed, {} failed, {} bytes freed",
                             report.succeeded(), report.failed(), report.bytes_freed));
    return report;
}

std::optional<DeletionReport> CleanupManager::execute(const Plan& plan,
                                                      const ConfirmCallback& confirm,
                                                      CleanupCallback cb) {
    if (plan.empty()) {
        return std::nullopt;
    }

    Selection selection = confirm ? confirm(plan) : Selection{};
    if (!selection.proceed) {
        devstrip_log("Cleanup declined");
        return std::nullopt;
    }

    std::vector<Candidate> approved = selection.indices.empty()
        ? plan.items()
        : plan.select(selection.indices);
    if (approved.empty()) {
        return std::nullopt;
    }
    return remove(approved, std::move(cb));
}
