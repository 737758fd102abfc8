#pragma once

#include <functional>
#include <optional>
#include <vector>
#include <core/types.hpp>
#include <scan/plan.hpp>

// Reported once per removed (or failed) item, in completion order.
struct CleanupProgress {
    size_t completed;          // items finished so far, this one included
    size_t total;
    const DeletionOutcome& outcome;
};

using CleanupCallback = std::function<void(const CleanupProgress&)>;

// Answer from the confirmation step.
struct Selection {
    bool proceed = false;
    std::vector<size_t> indices;   // zero-based plan indices; empty = everything
};

using ConfirmCallback = std::function<Selection(const Plan&)>;

class CleanupManager {
public:
    explicit CleanupManager(int jobs = 1);

    // Remove every approved candidate recursively. Failures are recorded per
    // item and never stop the rest. Outcomes follow the input order.
    DeletionReport remove(const std::vector<Candidate>& approved,
                          CleanupCallback cb = nullptr);

    // Ask `confirm` which part of the plan to delete, then remove it.
    // Returns nullopt when the user declines or the plan is empty.
    std::optional<DeletionReport> execute(const Plan& plan, const ConfirmCallback& confirm,
                                          CleanupCallback cb = nullptr);

private:
    DeletionOutcome remove_one(const Candidate& candidate);

    int jobs_;
};
