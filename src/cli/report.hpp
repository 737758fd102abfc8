#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <managers/cleanup_manager.hpp>
#include <scan/plan.hpp>

// ── Formatting ──────────────────────────────────────────────

// 1024-based size with one decimal: "512 B", "1.5 KB", "3 GB".
std::string humanize_bytes(uint64_t bytes);

// Shorten to at most `max_len` characters by replacing the middle with "…".
// Counts UTF-8 code points, not bytes.
std::string truncate_middle(const std::string& text, size_t max_len);

// Cut a status line to STATUS_TRUNCATE_CHARS, ending in "...".
std::string truncate_status(const std::string& text);

// "#####-----" style bar, rounded up so any progress shows at least one mark.
std::string render_progress_bar(size_t position, size_t total, size_t width);

// Color a size string by magnitude (KiB green, MiB blue, GiB yellow, TiB cyan).
std::string colorize_size(uint64_t bytes, const std::string& text);

// ── Report ──────────────────────────────────────────────────

// Table of plan items plus the reclaimable total.
std::string format_plan_report(const Plan& plan);

// Entries protected by keep-latest policies, with their age relative to `now`.
std::string format_kept(const std::vector<Candidate>& kept, TimePoint now);

// One line counting candidates left alone for being newer than `min_age`.
// Empty string when there are none.
std::string format_skipped_recent(const std::vector<Candidate>& recent,
                                  std::chrono::seconds min_age);

// Batched scan warnings. Empty string when there are none.
std::string format_warnings(const std::vector<ScanWarning>& warnings);

// "Removed N item(s); reclaimed approximately X." plus any failures.
std::string format_deletion_summary(const DeletionReport& report);

// ── Confirmation ────────────────────────────────────────────

// Parse the answer to the confirmation prompt for a plan of `count` items.
//   "yes" / "all"          proceed with everything
//   "", "n", "no"          decline
//   "1,3-5"                proceed with those one-based items
// Returns nullopt for anything else (junk, zero, out-of-range numbers).
std::optional<Selection> parse_selection(const std::string& input, size_t count);
