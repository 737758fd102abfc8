#include "filters.hpp"
#include <core/utils.hpp>
#include <algorithm>
#include <map>

bool is_eligible(const Candidate& candidate, std::chrono::seconds min_age,
                 const std::vector<fs::path>& excludes, TimePoint now) {
    if (is_excluded(candidate.path, excludes)) {
        return false;
    }
    // No age limit: future timestamps (clock skew, extracted archives) pass too
    if (min_age.count() == 0) {
        return true;
    }
    return now - candidate.mtime >= min_age;
}

int keep_count(RetentionPolicy policy, const ScanConfig& config) {
    switch (policy) {
        case RetentionPolicy::KeepLatestDerived: return config.keep_latest_derived;
        case RetentionPolicy::KeepLatestCache:   return config.keep_latest_cache;
        case RetentionPolicy::None:              return 0;
    }
    return 0;
}

bool newer_first(const Candidate& a, const Candidate& b) {
    if (a.mtime != b.mtime) return a.mtime > b.mtime;
    return a.path < b.path;
}

RetentionResult apply_retention(std::vector<Candidate> candidates, const ScanConfig& config) {
    RetentionResult result;

    // Index candidates of each retention group; the policy follows from the
    // category so the category alone identifies the group.
    std::map<Category, std::vector<size_t>> groups;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (retention_policy(candidates[i].category) != RetentionPolicy::None) {
            groups[candidates[i].category].push_back(i);
        }
    }

    std::vector<bool> keep(candidates.size(), false);
    for (auto& [category, indices] : groups) {
        int n = keep_count(retention_policy(category), config);
        if (n <= 0) continue;

        std::sort(indices.begin(), indices.end(), [&](size_t a, size_t b) {
            return newer_first(candidates[a], candidates[b]);
        });
        size_t limit = std::min(indices.size(), static_cast<size_t>(n));
        for (size_t k = 0; k < limit; ++k) {
            keep[indices[k]] = true;
        }
    }

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (keep[i]) {
            result.kept.push_back(std::move(candidates[i]));
        } else {
            result.removable.push_back(std::move(candidates[i]));
        }
    }
    std::sort(result.kept.begin(), result.kept.end(), newer_first);
    return result;
}
