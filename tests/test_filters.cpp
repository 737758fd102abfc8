#include <gtest/gtest.h>
#include <scan/filters.hpp>
#include <core/time_utils.hpp>

using namespace std::chrono;

static const TimePoint NOW = system_clock::time_point(seconds(1'750'000'000));

static Candidate make(const std::string& path, Category cat, TimePoint mtime) {
    return Candidate{path, cat, "test", mtime, std::nullopt};
}

static ScanConfig keep(int derived, int cache) {
    ScanConfig config;
    config.keep_latest_derived = derived;
    config.keep_latest_cache = cache;
    return config;
}

// ── Age & exclusion ─────────────────────────────────────────

TEST(AgeFilter, ThresholdIsInclusive) {
    auto min_age = days(2);
    auto exact = make("/p/build", Category::ProjectArtifact, NOW - min_age);
    auto younger = make("/p/build", Category::ProjectArtifact, NOW - min_age + milliseconds(1));
    auto older = make("/p/build", Category::ProjectArtifact, NOW - min_age - milliseconds(1));

    EXPECT_TRUE(is_eligible(exact, min_age, {}, NOW));
    EXPECT_FALSE(is_eligible(younger, min_age, {}, NOW));
    EXPECT_TRUE(is_eligible(older, min_age, {}, NOW));
}

TEST(AgeFilter, ZeroMinAgeAcceptsCurrentTime) {
    auto c = make("/p/build", Category::ProjectArtifact, NOW);
    EXPECT_TRUE(is_eligible(c, seconds(0), {}, NOW));
}

TEST(AgeFilter, ZeroMinAgeAcceptsFutureTimestamps) {
    auto ahead = make("/p/build", Category::ProjectArtifact, NOW + hours(1));
    EXPECT_TRUE(is_eligible(ahead, seconds(0), {}, NOW));
    EXPECT_FALSE(is_eligible(ahead, seconds(1), {}, NOW));
    EXPECT_FALSE(is_eligible(ahead, seconds(0), {"/p"}, NOW));
}

TEST(AgeFilter, ExcludedPathsAreNeverEligible) {
    auto old = NOW - days(30);
    std::vector<fs::path> excludes = {"/work/keep"};

    EXPECT_FALSE(is_eligible(make("/work/keep", Category::ProjectArtifact, old),
                             seconds(0), excludes, NOW));
    EXPECT_FALSE(is_eligible(make("/work/keep/app/build", Category::ProjectArtifact, old),
                             seconds(0), excludes, NOW));
    EXPECT_TRUE(is_eligible(make("/work/keeper/build", Category::ProjectArtifact, old),
                            seconds(0), excludes, NOW));
}

// ── Retention ───────────────────────────────────────────────

TEST(Retention, KeepsNewestPerCategory) {
    std::vector<Candidate> in = {
        make("/dd/A", Category::DerivedData, NOW - days(10)),
        make("/dd/B", Category::DerivedData, NOW - days(1)),
        make("/dd/C", Category::DerivedData, NOW - days(5)),
    };
    auto r = apply_retention(in, keep(1, 1));

    ASSERT_EQ(r.kept.size(), 1u);
    EXPECT_EQ(r.kept[0].path, "/dd/B");
    ASSERT_EQ(r.removable.size(), 2u);
    // Input order is preserved for what remains
    EXPECT_EQ(r.removable[0].path, "/dd/A");
    EXPECT_EQ(r.removable[1].path, "/dd/C");
}

TEST(Retention, FewerThanNKeepsAll) {
    std::vector<Candidate> in = {
        make("/dd/A", Category::DerivedData, NOW - days(10)),
        make("/dd/B", Category::DerivedData, NOW - days(3)),
    };
    auto r = apply_retention(in, keep(5, 1));
    EXPECT_EQ(r.kept.size(), 2u);
    EXPECT_TRUE(r.removable.empty());
    EXPECT_EQ(r.kept[0].path, "/dd/B");
}

TEST(Retention, ZeroKeepsNothing) {
    std::vector<Candidate> in = {
        make("/dd/A", Category::DerivedData, NOW - days(10)),
        make("/brew/x", Category::HomebrewCache, NOW - days(3)),
    };
    auto r = apply_retention(in, keep(0, 0));
    EXPECT_TRUE(r.kept.empty());
    EXPECT_EQ(r.removable.size(), 2u);
}

TEST(Retention, CategoriesAreRankedSeparately) {
    std::vector<Candidate> in = {
        make("/dd/A", Category::DerivedData, NOW - days(10)),
        make("/dd/B", Category::DerivedData, NOW - days(9)),
        make("/ar/A", Category::Archives, NOW - days(50)),
        make("/ar/B", Category::Archives, NOW - days(40)),
        make("/brew/1", Category::HomebrewCache, NOW - days(7)),
        make("/brew/2", Category::HomebrewCache, NOW - days(8)),
        make("/brew/3", Category::HomebrewCache, NOW - days(6)),
    };
    auto r = apply_retention(in, keep(1, 2));

    std::vector<fs::path> kept;
    for (const auto& c : r.kept) kept.push_back(c.path);
    // Newest first across all groups
    EXPECT_EQ(kept, (std::vector<fs::path>{"/brew/3", "/brew/1", "/dd/B", "/ar/B"}));
    EXPECT_EQ(r.removable.size(), 3u);
}

TEST(Retention, NonePolicyPassesThrough) {
    std::vector<Candidate> in = {
        make("/p/a/node_modules", Category::ProjectArtifact, NOW - days(1)),
        make("/p/b/node_modules", Category::ProjectArtifact, NOW - days(2)),
        make("/home/.npm", Category::NodeCache, NOW - days(3)),
    };
    auto r = apply_retention(in, keep(3, 3));
    EXPECT_TRUE(r.kept.empty());
    EXPECT_EQ(r.removable.size(), 3u);
}

TEST(Retention, EqualTimesBreakTiesByPath) {
    auto t = NOW - days(4);
    std::vector<Candidate> in = {
        make("/dd/zeta", Category::DerivedData, t),
        make("/dd/alpha", Category::DerivedData, t),
        make("/dd/mid", Category::DerivedData, t),
    };
    auto r = apply_retention(in, keep(1, 0));
    ASSERT_EQ(r.kept.size(), 1u);
    EXPECT_EQ(r.kept[0].path, "/dd/alpha");
}

TEST(Retention, KeepCountFollowsPolicy) {
    auto config = keep(3, 7);
    EXPECT_EQ(keep_count(RetentionPolicy::KeepLatestDerived, config), 3);
    EXPECT_EQ(keep_count(RetentionPolicy::KeepLatestCache, config), 7);
    EXPECT_EQ(keep_count(RetentionPolicy::None, config), 0);
}
