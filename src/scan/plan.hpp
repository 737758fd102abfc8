#pragma once

#include <cstdint>
#include <vector>
#include <core/types.hpp>

// Final, size-ordered deletion proposal. Immutable once built.
class Plan {
public:
    Plan() = default;

    const std::vector<Candidate>& items() const { return items_; }
    uint64_t total_bytes() const { return total_bytes_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const Candidate& operator[](size_t i) const { return items_[i]; }

    // Items at the given zero-based indices, in plan order. Out-of-range
    // and repeated indices are ignored.
    std::vector<Candidate> select(const std::vector<size_t>& indices) const;

private:
    Plan(std::vector<Candidate> items, uint64_t total)
        : items_(std::move(items)), total_bytes_(total) {}

    std::vector<Candidate> items_;
    uint64_t total_bytes_ = 0;

    friend Plan build_plan(std::vector<Candidate> candidates);
};

// Sort by size descending (ties by path ascending), drop zero-byte entries
// and total the rest. Throws std::logic_error if a candidate is unsized or
// lies below another candidate; both mean the walker is broken.
Plan build_plan(std::vector<Candidate> candidates);
