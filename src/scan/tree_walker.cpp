#include "tree_walker.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

static void add_root(std::vector<WalkRoot>& roots, const fs::path& path, int max_depth) {
    for (auto& r : roots) {
        if (r.path == path) {
            r.max_depth = std::max(r.max_depth, max_depth);
            return;
        }
    }
    roots.push_back({path, max_depth});
}

TreeWalker::TreeWalker(const RuleCatalog& catalog, const ScanConfig& config,
                       WarningSink& warnings, const std::atomic<bool>* cancel)
    : catalog_(catalog), config_(config), warnings_(warnings), cancel_(cancel) {
    for (const auto& root : config_.roots) {
        add_root(roots_, canonical_or_self(root), config_.max_depth);
    }
    for (const auto& anchor : catalog_.location_anchors()) {
        std::error_code ec;
        if (fs::is_directory(anchor, ec)) {
            add_root(roots_, canonical_or_self(anchor), LOCATION_ANCHOR_DEPTH);
        }
    }

    // Ancestors sort before their descendants, so a root that lies inside a
    // candidate found from an enclosing root is recognized and skipped.
    std::sort(roots_.begin(), roots_.end(),
              [](const WalkRoot& a, const WalkRoot& b) { return a.path < b.path; });
}

bool TreeWalker::canceled() const {
    return cancel_ && cancel_->load();
}

std::optional<Candidate> TreeWalker::next() {
    while (!canceled()) {
        if (stack_.empty()) {
            if (!start_next_root()) return std::nullopt;
            continue;
        }

        Frame frame = std::move(stack_.back());
        stack_.pop_back();

        auto hit = visit(frame);
        if (hit) return hit;
    }

    stack_.clear();
    return std::nullopt;
}

bool TreeWalker::start_next_root() {
    while (root_index_ < roots_.size()) {
        const WalkRoot& root = roots_[root_index_++];

        if (is_excluded(root.path, config_.excludes)) {
            devstrip_log(fmt::format("walker: root {} is excluded", root.path.string()));
            continue;
        }
        if (inside_emitted(root.path)) {
            devstrip_log(fmt::format("walker: root {} lies inside a candidate", root.path.string()));
            continue;
        }

        std::error_code ec;
        auto status = fs::symlink_status(root.path, ec);
        if (ec || !fs::is_directory(status)) {
            if (ec && ec != std::errc::no_such_file_or_directory) {
                warnings_.warn(root.path, "cannot stat root", ec);
            }
            continue;
        }

        depth_limit_ = root.max_depth;
        stack_.push_back({root.path, 0});
        return true;
    }
    return false;
}

bool TreeWalker::inside_emitted(const fs::path& path) const {
    if (emitted_.empty()) return false;
    fs::path p = path;
    while (true) {
        if (emitted_.count(p)) return true;
        fs::path parent = p.parent_path();
        if (parent == p || parent.empty()) return false;
        p = parent;
    }
}

// Roots not yet started that can walk into `path` again.
bool TreeWalker::reachable_from_later_root(const fs::path& path) const {
    for (size_t i = root_index_; i < roots_.size(); ++i) {
        if (is_within(path, roots_[i].path)) return true;
    }
    return false;
}

bool TreeWalker::contains_excluded(const fs::path& path) const {
    for (const auto& ex : config_.excludes) {
        if (is_strict_descendant(ex, path)) return true;
    }
    return false;
}

std::optional<Candidate> TreeWalker::visit(const Frame& frame) {
    if (is_excluded(frame.path, config_.excludes)) {
        return std::nullopt;
    }

    // A root is only ever claimed by a location rule
    auto match = catalog_.match(frame.path, frame.depth > 0);
    if (match) {
        if (emitted_.count(frame.path)) {
            return std::nullopt;
        }
        if (!contains_excluded(frame.path)) {
            auto mtime = platform::modification_time(frame.path);
            if (!mtime) {
                warnings_.warn(frame.path, "cannot read modification time");
                return std::nullopt;
            }
            emitted_.insert(frame.path);
            return Candidate{frame.path, match->category, match->reason, *mtime, std::nullopt};
        }
        devstrip_log(fmt::format("walker: {} holds an excluded path, descending",
                                 frame.path.string()));
    }

    // Directories up to the limit are listed, so their children are classified
    if (frame.depth <= depth_limit_) {
        descend(frame);
    }
    return std::nullopt;
}

void TreeWalker::descend(const Frame& frame) {
    // Overlapping roots: only relist a directory if this visit can go deeper
    int budget = depth_limit_ - frame.depth;
    auto seen = listed_budget_.find(frame.path);
    if (seen != listed_budget_.end() && seen->second >= budget) {
        return;
    }
    if (reachable_from_later_root(frame.path)) {
        listed_budget_[frame.path] = budget;
    } else if (seen != listed_budget_.end()) {
        listed_budget_.erase(seen);
    }
    ++listed_;

    if (progress_) progress_("Scanning: " + frame.path.string());

    std::vector<fs::path> children;
    std::error_code ec;
    fs::directory_iterator it(frame.path, ec);
    fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        auto status = it->symlink_status(entry_ec);
        if (entry_ec) {
            warnings_.warn(it->path(), "cannot stat entry", entry_ec);
            continue;
        }
        if (fs::is_symlink(status) || !fs::is_directory(status)) {
            continue;
        }
        if (catalog_.should_skip(it->path().filename().string())) {
            continue;
        }
        children.push_back(it->path());
    }
    if (ec) {
        warnings_.warn(frame.path, "cannot read directory", ec);
    }

    // Reverse order onto the stack so children pop in ascending order
    std::sort(children.begin(), children.end());
    for (auto c = children.rbegin(); c != children.rend(); ++c) {
        stack_.push_back({std::move(*c), frame.depth + 1});
    }
}
