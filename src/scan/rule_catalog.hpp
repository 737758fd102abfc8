#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct Rule {
    enum Kind {
        CHILD_OF,   // parent directory is exactly `anchor`
        EXACT,      // directory is exactly `anchor`
        NAME,       // final component equals `pattern`
        SUFFIX,     // final component ends with `pattern`
    };

    Kind kind;
    std::string pattern;
    fs::path anchor;
    Category category;
    std::string reason;

    static Rule child_of(const fs::path& anchor, Category category, const std::string& reason);
    static Rule exact(const fs::path& anchor, Category category, const std::string& reason);
    static Rule name(const std::string& name, Category category, const std::string& reason);
    static Rule suffix(const std::string& suffix, Category category, const std::string& reason);

    bool is_location() const { return kind == CHILD_OF || kind == EXACT; }
};

struct RuleMatch {
    Category category;
    std::string reason;
};

// Ordered, immutable rule table. Evaluated first-match-wins; location rules
// must precede name rules. Safe to share between threads.
class RuleCatalog {
public:
    explicit RuleCatalog(std::vector<Rule> rules,
                         std::vector<std::string> skip_names = {});

    // The built-in catalog: Xcode, Homebrew and language caches under `home`
    // followed by project build-artifact names.
    static RuleCatalog standard(const fs::path& home);

    // Classify a directory. Name/suffix rules are consulted only when
    // `allow_name_rules` is set and the directory does not shadow a location
    // anchor (see shadows_location).
    std::optional<RuleMatch> match(const fs::path& path, bool allow_name_rules = true) const;

    // Directories the walker never enters (.git, .idea, ...).
    bool should_skip(const std::string& dir_name) const;

    // True if `path` is the parent of a CHILD_OF anchor's entries or an
    // ancestor of any location anchor. Such a directory is never claimed by a
    // name rule, so e.g. "~/.cache" cannot swallow "~/.cache/pip".
    bool shadows_location(const fs::path& path) const;

    // Distinct anchors of all location rules, in rule order.
    std::vector<fs::path> location_anchors() const;

    const std::vector<Rule>& rules() const { return rules_; }

private:
    std::vector<Rule> rules_;
    std::vector<std::string> skip_names_;
};
