#include "rule_catalog.hpp"
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <algorithm>

Rule Rule::child_of(const fs::path& anchor, Category category, const std::string& reason) {
    return Rule{CHILD_OF, "", anchor, category, reason};
}

Rule Rule::exact(const fs::path& anchor, Category category, const std::string& reason) {
    return Rule{EXACT, "", anchor, category, reason};
}

Rule Rule::name(const std::string& name, Category category, const std::string& reason) {
    return Rule{NAME, name, fs::path(), category, reason};
}

Rule Rule::suffix(const std::string& suffix, Category category, const std::string& reason) {
    return Rule{SUFFIX, suffix, fs::path(), category, reason};
}

// ── Built-in tables ─────────────────────────────────────────

namespace {

struct LocationEntry {
    Rule::Kind kind;
    const char* relative;
    Category category;
    const char* reason;
};

// Order matters: first match wins.
const LocationEntry HOME_LOCATIONS[] = {
    {Rule::CHILD_OF, "Library/Developer/Xcode/DerivedData",   Category::DerivedData,   "Old DerivedData projects"},
    {Rule::CHILD_OF, "Library/Developer/Xcode/Archives",      Category::Archives,      "Old Xcode archives"},
    {Rule::EXACT,    "Library/Developer/CoreSimulator/Caches", Category::CoreSimulator, "CoreSimulator caches"},
    {Rule::CHILD_OF, "Library/Caches/Homebrew",               Category::HomebrewCache, "Homebrew download cache"},

    {Rule::EXACT, "Library/Caches/pip",     Category::PythonCache, "pip cache"},
    {Rule::EXACT, ".cache/pip",             Category::PythonCache, "pip cache"},
    {Rule::EXACT, ".cache/pip-tools",       Category::PythonCache, "pip-tools cache"},
    {Rule::EXACT, ".cache/pipenv",          Category::PythonCache, "pipenv cache"},
    {Rule::EXACT, ".cache/pre-commit",      Category::PythonCache, "pre-commit cache"},
    {Rule::EXACT, ".cache/matplotlib",      Category::PythonCache, "matplotlib cache"},
    {Rule::EXACT, ".cache/pytest",          Category::PythonCache, "pytest cache"},
    {Rule::EXACT, ".cache/ruff",            Category::PythonCache, "ruff cache"},
    {Rule::EXACT, ".cache/uv",              Category::PythonCache, "uv cache"},

    {Rule::EXACT, ".npm",                   Category::NodeCache, "npm cache"},
    {Rule::EXACT, "Library/Caches/npm",     Category::NodeCache, "npm cache"},
    {Rule::EXACT, "Library/Caches/Yarn",    Category::NodeCache, "Yarn cache"},
    {Rule::EXACT, ".cache/yarn",            Category::NodeCache, "Yarn cache"},

    {Rule::EXACT, "Library/Caches/CocoaPods", Category::CocoaPodsCache, "CocoaPods cache"},

    {Rule::EXACT, ".gradle/caches",         Category::GradleCache, "Gradle caches"},
    {Rule::EXACT, ".gradle/daemon",         Category::GradleCache, "Gradle daemons"},
    {Rule::EXACT, ".gradle/native",         Category::GradleCache, "Gradle native cache"},

    {Rule::EXACT, "Library/Caches/JetBrains", Category::JetBrainsCache, "JetBrains IDE caches"},

    {Rule::EXACT, "Library/Application Support/Code/Cache",      Category::VSCodeCache, "VSCode cache"},
    {Rule::EXACT, "Library/Application Support/Code/CachedData", Category::VSCodeCache, "VSCode cached data"},

    {Rule::EXACT, "Library/Application Support/Slack/Service Worker/CacheStorage",
                  Category::SlackCache, "Slack cache"},
};

const char* const PROJECT_ARTIFACT_NAMES[] = {
    "__pycache__",
    "build",
    "dist",
    "out",
    "_build",
    "target",
    "node_modules",
    "DerivedData",
    ".pytest_cache",
    ".mypy_cache",
    ".ruff_cache",
    ".tox",
    ".eggs",
    "coverage",
    ".parcel-cache",
    ".sass-cache",
    ".cache",
};

const char* const PROJECT_ARTIFACT_SUFFIXES[] = {
    ".egg-info",
};

// Version-control and IDE metadata: never entered, never matched
const char* const SKIP_DIR_NAMES[] = {
    ".git", ".hg", ".svn", ".idea", ".vscode", ".gradle",
};

constexpr const char* PROJECT_REASON = "Stale build or cache";

} // namespace

RuleCatalog::RuleCatalog(std::vector<Rule> rules, std::vector<std::string> skip_names)
    : rules_(std::move(rules)), skip_names_(std::move(skip_names)) {}

RuleCatalog RuleCatalog::standard(const fs::path& home) {
    std::vector<Rule> rules;

    for (const auto& loc : HOME_LOCATIONS) {
        fs::path anchor = canonical_or_self(home / loc.relative);
        if (loc.kind == Rule::CHILD_OF) {
            rules.push_back(Rule::child_of(anchor, loc.category, loc.reason));
        } else {
            rules.push_back(Rule::exact(anchor, loc.category, loc.reason));
        }
    }
    for (const char* name : PROJECT_ARTIFACT_NAMES) {
        rules.push_back(Rule::name(name, Category::ProjectArtifact, PROJECT_REASON));
    }
    for (const char* suffix : PROJECT_ARTIFACT_SUFFIXES) {
        rules.push_back(Rule::suffix(suffix, Category::ProjectArtifact, PROJECT_REASON));
    }

    std::vector<std::string> skip(std::begin(SKIP_DIR_NAMES), std::end(SKIP_DIR_NAMES));
    return RuleCatalog(std::move(rules), std::move(skip));
}

std::optional<RuleMatch> RuleCatalog::match(const fs::path& path, bool allow_name_rules) const {
    std::string dir_name = path.filename().string();
    bool name_rules = allow_name_rules && !shadows_location(path);

    for (const auto& rule : rules_) {
        switch (rule.kind) {
            case Rule::CHILD_OF:
                if (path.parent_path() == rule.anchor) {
                    return RuleMatch{rule.category, rule.reason};
                }
                break;
            case Rule::EXACT:
                if (path == rule.anchor) {
                    return RuleMatch{rule.category, rule.reason};
                }
                break;
            case Rule::NAME:
                if (name_rules && dir_name == rule.pattern) {
                    return RuleMatch{rule.category, rule.reason + " (" + dir_name + ")"};
                }
                break;
            case Rule::SUFFIX:
                if (name_rules && dir_name.size() > rule.pattern.size() &&
                    StringUtils::ends_with(dir_name, rule.pattern)) {
                    return RuleMatch{rule.category, rule.reason + " (" + dir_name + ")"};
                }
                break;
        }
    }
    return std::nullopt;
}

bool RuleCatalog::should_skip(const std::string& dir_name) const {
    return std::find(skip_names_.begin(), skip_names_.end(), dir_name) != skip_names_.end();
}

bool RuleCatalog::shadows_location(const fs::path& path) const {
    for (const auto& rule : rules_) {
        if (!rule.is_location()) continue;
        if (rule.kind == Rule::CHILD_OF && path == rule.anchor) return true;
        if (is_strict_descendant(rule.anchor, path)) return true;
    }
    return false;
}

std::vector<fs::path> RuleCatalog::location_anchors() const {
    std::vector<fs::path> anchors;
    for (const auto& rule : rules_) {
        if (!rule.is_location()) continue;
        if (std::find(anchors.begin(), anchors.end(), rule.anchor) == anchors.end()) {
            anchors.push_back(rule.anchor);
        }
    }
    return anchors;
}
