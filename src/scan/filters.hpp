#pragma once

#include <chrono>
#include <vector>
#include <core/types.hpp>

// ── Age & exclusion ─────────────────────────────────────────

// Eligible iff `now - mtime >= min_age` (inclusive) and the path is not
// equal to or below any exclude. A zero min_age accepts any mtime, including
// one in the future.
bool is_eligible(const Candidate& candidate, std::chrono::seconds min_age,
                 const std::vector<fs::path>& excludes, TimePoint now);

// ── Retention ───────────────────────────────────────────────

struct RetentionResult {
    std::vector<Candidate> removable;
    std::vector<Candidate> kept;     // newest N per retention group
};

// Number of entries kept for a policy under `config` (0 for None).
int keep_count(RetentionPolicy policy, const ScanConfig& config);

// Orders newest first; equal mtimes fall back to ascending path.
bool newer_first(const Candidate& a, const Candidate& b);

// Partition by category. For categories with a keep-latest policy the N most
// recently modified entries move to `kept`; everything else is removable.
// Removable entries keep their relative input order.
RetentionResult apply_retention(std::vector<Candidate> candidates, const ScanConfig& config);
