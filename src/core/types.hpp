#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <filesystem>
#include <chrono>
#include <cstdint>

namespace fs = std::filesystem;

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

using TimePoint = std::chrono::system_clock::time_point;

// ── Categories ──────────────────────────────────────────────

enum class RetentionPolicy {
    None,
    KeepLatestDerived,   // governed by keep_latest_derived
    KeepLatestCache,     // governed by keep_latest_cache
};

enum class Category {
    DerivedData,
    Archives,
    CoreSimulator,
    HomebrewCache,
    PythonCache,
    NodeCache,
    CocoaPodsCache,
    GradleCache,
    JetBrainsCache,
    VSCodeCache,
    SlackCache,
    ProjectArtifact,
};

// Short label, e.g. "DerivedData" or "Project artifact".
const char* category_label(Category c);

// Display group shown in the report's Category column ("Xcode", "Python", ...).
const char* category_group(Category c);

RetentionPolicy retention_policy(Category c);

// ── Scan data ───────────────────────────────────────────────

struct Candidate {
    fs::path path;                       // absolute, canonical
    Category category;
    std::string reason;
    TimePoint mtime;                     // directory's own modification time
    std::optional<uint64_t> size_bytes;  // unset until sized

    uint64_t bytes() const { return size_bytes.value_or(0); }
};

struct ScanConfig {
    std::vector<fs::path> roots;
    std::vector<fs::path> excludes;
    std::chrono::seconds min_age{0};
    int max_depth = 0;
    int keep_latest_derived = 0;
    int keep_latest_cache = 0;
    int jobs = 1;                        // sizing / deletion workers
};

// Recoverable I/O problem hit during walking or sizing
struct ScanWarning {
    fs::path path;
    std::string message;
};

// ── Deletion ────────────────────────────────────────────────

struct DeletionOutcome {
    Candidate candidate;
    bool success = false;
    std::string error;
};

struct DeletionReport {
    std::vector<DeletionOutcome> outcomes;
    uint64_t bytes_freed = 0;

    size_t succeeded() const;
    size_t failed() const;
    bool has_failures() const { return failed() > 0; }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
