#pragma once

#include <atomic>
#include <map>
#include <optional>
#include <set>
#include <vector>
#include <core/types.hpp>
#include <scan/rule_catalog.hpp>
#include <scan/warning_sink.hpp>

struct WalkRoot {
    fs::path path;
    int max_depth;
};

// Lazy, single-pass discovery of candidate directories.
//
// Roots are the configured roots plus every location anchor of the catalog,
// canonicalized and visited ancestors-first. Each call to next() advances a
// depth-first traversal until the next matched directory is found. Matched
// directories are never entered, symlinks are never followed, and a physical
// path is emitted at most once across all roots.
class TreeWalker {
public:
    TreeWalker(const RuleCatalog& catalog, const ScanConfig& config, WarningSink& warnings,
               const std::atomic<bool>* cancel = nullptr);

    TreeWalker(const TreeWalker&) = delete;
    TreeWalker& operator=(const TreeWalker&) = delete;

    // Next candidate (size unset), or nullopt when exhausted or canceled.
    std::optional<Candidate> next();

    // Called with "Scanning: <dir>" for every directory listed.
    void set_progress(StatusCallback cb) { progress_ = std::move(cb); }

    const std::vector<WalkRoot>& roots() const { return roots_; }
    size_t directories_listed() const { return listed_; }

    // Directories remembered because a root still to come lies above them.
    size_t tracked_directories() const { return listed_budget_.size(); }

private:
    struct Frame {
        fs::path path;
        int depth;
    };

    bool canceled() const;
    bool start_next_root();
    bool inside_emitted(const fs::path& path) const;
    bool reachable_from_later_root(const fs::path& path) const;
    bool contains_excluded(const fs::path& path) const;
    std::optional<Candidate> visit(const Frame& frame);
    void descend(const Frame& frame);

    const RuleCatalog& catalog_;
    const ScanConfig& config_;
    WarningSink& warnings_;
    const std::atomic<bool>* cancel_;
    StatusCallback progress_;

    std::vector<WalkRoot> roots_;
    size_t root_index_ = 0;
    int depth_limit_ = 0;
    std::vector<Frame> stack_;

    std::set<fs::path> emitted_;
    std::map<fs::path, int> listed_budget_;   // remaining depth each dir was listed with
    size_t listed_ = 0;
};
