#include "plan.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

std::vector<Candidate> Plan::select(const std::vector<size_t>& indices) const {
    std::vector<bool> chosen(items_.size(), false);
    for (size_t i : indices) {
        if (i < items_.size()) chosen[i] = true;
    }
    std::vector<Candidate> out;
    for (size_t i = 0; i < items_.size(); ++i) {
        if (chosen[i]) out.push_back(items_[i]);
    }
    return out;
}

// In path order a descendant always directly follows its ancestor or one of
// the ancestor's other descendants, so checking neighbours is sufficient.
static void check_disjoint(const std::vector<Candidate>& candidates) {
    std::vector<const fs::path*> paths;
    paths.reserve(candidates.size());
    for (const auto& c : candidates) paths.push_back(&c.path);
    std::sort(paths.begin(), paths.end(),
              [](const fs::path* a, const fs::path* b) { return *a < *b; });

    for (size_t i = 1; i < paths.size(); ++i) {
        if (is_within(*paths[i], *paths[i - 1])) {
            throw std::logic_error(fmt::format("candidate {} overlaps candidate {}",
                                               paths[i]->string(), paths[i - 1]->string()));
        }
    }
}

Plan build_plan(std::vector<Candidate> candidates) {
    for (const auto& c : candidates) {
        if (!c.size_bytes.has_value()) {
            throw std::logic_error("candidate reached the plan unsized: " + c.path.string());
        }
    }
    check_disjoint(candidates);

    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [](const Candidate& c) { return c.bytes() == 0; }),
                     candidates.end());

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.bytes() != b.bytes()) return a.bytes() > b.bytes();
        return a.path < b.path;
    });

    uint64_t total = 0;
    for (const auto& c : candidates) total += c.bytes();

    return Plan(std::move(candidates), total);
}
