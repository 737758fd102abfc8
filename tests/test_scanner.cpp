#include "temp_tree.hpp"
#include <scan/scanner.hpp>
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <platform/platform.hpp>
#include <map>

class ScannerTest : public TempTree {
protected:
    ScanConfig config;

    void SetUp() override {
        TempTree::SetUp();
        config.roots = {test_dir};
        config.max_depth = 5;
        config.min_age = days(2);
        config.keep_latest_derived = 1;
        config.keep_latest_cache = 1;
        config.jobs = 2;
    }

    // Xcode-style layout rooted in the fixture instead of ~/Library
    RuleCatalog derived_data_catalog() {
        return RuleCatalog({
            Rule::child_of(test_dir / "DerivedData", Category::DerivedData,
                           "Old DerivedData projects"),
            Rule::name("node_modules", Category::ProjectArtifact, "Stale build or cache"),
            Rule::name("build", Category::ProjectArtifact, "Stale build or cache"),
        });
    }

    // Path -> size of every entry below test_dir
    std::map<fs::path, uintmax_t> snapshot() {
        std::map<fs::path, uintmax_t> out;
        for (const auto& e : fs::recursive_directory_iterator(test_dir)) {
            out[e.path()] = e.is_regular_file() ? e.file_size() : 0;
        }
        return out;
    }
};

TEST_F(ScannerTest, DerivedDataScenario) {
    write_file("DerivedData/AppA/Build/Products/app.bin", 500 * MIB);
    write_file("DerivedData/AppB/Build/Products/app.bin", 300 * MIB);
    set_age(test_dir / "DerivedData/AppA", days(10));
    set_age(test_dir / "DerivedData/AppB", days(1));

    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run();
    ASSERT_TRUE(r.is_ok()) << r.error;

    const auto& plan = r.value.plan;
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].path, test_dir / "DerivedData/AppA");
    EXPECT_EQ(plan[0].category, Category::DerivedData);
    EXPECT_EQ(plan.total_bytes(), 500 * MIB);

    ASSERT_EQ(r.value.kept.size(), 1u);
    EXPECT_EQ(r.value.kept[0].path, test_dir / "DerivedData/AppB");
    EXPECT_EQ(r.value.discovered, 2u);
    EXPECT_FALSE(r.value.canceled);
}

TEST_F(ScannerTest, RetentionRanksRecentEntriesToo) {
    // The newest entry is too recent to delete but still counts as the kept one
    write_file("DerivedData/Old1/x.bin", 10 * MIB);
    write_file("DerivedData/Old2/x.bin", 20 * MIB);
    write_file("DerivedData/Fresh/x.bin", 30 * MIB);
    set_age(test_dir / "DerivedData/Old1", days(20));
    set_age(test_dir / "DerivedData/Old2", days(15));
    set_age(test_dir / "DerivedData/Fresh", std::chrono::seconds(3600));

    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run();
    ASSERT_TRUE(r.is_ok());

    ASSERT_EQ(r.value.plan.size(), 2u);
    EXPECT_EQ(r.value.plan[0].path, test_dir / "DerivedData/Old2");
    EXPECT_EQ(r.value.plan[1].path, test_dir / "DerivedData/Old1");
    EXPECT_EQ(r.value.plan.total_bytes(), 30 * MIB);
    EXPECT_TRUE(r.value.too_recent.empty());
}

TEST_F(ScannerTest, AggressiveSettingsPlanEverything) {
    write_file("DerivedData/AppA/a.bin", 500 * MIB);
    write_file("DerivedData/AppB/b.bin", 300 * MIB);
    set_age(test_dir / "DerivedData/AppA", days(10));
    set_age(test_dir / "DerivedData/AppB", days(1));
    config.min_age = std::chrono::seconds(0);
    config.keep_latest_derived = 0;

    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run();
    ASSERT_TRUE(r.is_ok());

    ASSERT_EQ(r.value.plan.size(), 2u);
    EXPECT_EQ(r.value.plan[0].path, test_dir / "DerivedData/AppA");
    EXPECT_EQ(r.value.plan.total_bytes(), 800 * MIB);
    EXPECT_TRUE(r.value.kept.empty());
}

TEST_F(ScannerTest, RecentArtifactsAreReportedNotPlanned) {
    write_file("app/node_modules/pkg/index.js", 4096);
    write_file("web/node_modules/pkg/index.js", 8192);
    set_age(test_dir / "app/node_modules", days(30));

    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run();
    ASSERT_TRUE(r.is_ok());

    ASSERT_EQ(r.value.plan.size(), 1u);
    EXPECT_EQ(r.value.plan[0].path, test_dir / "app/node_modules");
    ASSERT_EQ(r.value.too_recent.size(), 1u);
    EXPECT_EQ(r.value.too_recent[0].path, test_dir / "web/node_modules");
    EXPECT_FALSE(r.value.too_recent[0].size_bytes.has_value());
}

TEST_F(ScannerTest, EmptyArtifactsAreDropped) {
    make_dir("app/build");
    write_file("lib/build/out.o", 10);
    set_age(test_dir / "app/build", days(9));
    set_age(test_dir / "lib/build", days(9));

    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.plan.size(), 1u);
    EXPECT_EQ(r.value.plan[0].path, test_dir / "lib/build");
}

TEST_F(ScannerTest, ExcludedPathsNeverReachThePlan) {
    write_file("keep/node_modules/a.js", 100);
    write_file("drop/node_modules/a.js", 100);
    set_age(test_dir / "keep/node_modules", days(9));
    set_age(test_dir / "drop/node_modules", days(9));
    config.excludes = {test_dir / "keep"};

    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.plan.size(), 1u);
    EXPECT_EQ(r.value.plan[0].path, test_dir / "drop/node_modules");
}

TEST_F(ScannerTest, ScanningNeverModifiesTheTree) {
    write_file("DerivedData/AppA/a.bin", 5 * MIB);
    write_file("app/node_modules/x/y.js", 1234);
    write_file("app/src/main.js", 99);
    set_age(test_dir / "DerivedData/AppA", days(10));
    set_age(test_dir / "app/node_modules", days(10));

    auto before = snapshot();
    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run();
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.plan.empty());
    EXPECT_EQ(snapshot(), before);
}

TEST_F(ScannerTest, NoCandidateIsInsideAnother) {
    write_file("a/node_modules/b/node_modules/c.js", 10);
    write_file("a/build/node_modules/d.js", 10);
    set_age(test_dir / "a/node_modules", days(5));
    set_age(test_dir / "a/build", days(5));
    config.roots = {test_dir, test_dir / "a", test_dir / "a/node_modules/b"};

    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.plan.size(), 2u);
    EXPECT_EQ(r.value.discovered, 2u);
}

TEST_F(ScannerTest, ManyCandidatesAcrossWorkers) {
    uint64_t expected = 0;
    for (int i = 0; i < 40; ++i) {
        std::string dir = "proj" + std::to_string(i) + "/build";
        write_file(dir + "/obj.o", 1000 + i);
        set_age(test_dir / dir, days(3));
        expected += 1000 + i;
    }
    config.jobs = 8;

    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.plan.size(), 40u);
    EXPECT_EQ(r.value.plan.total_bytes(), expected);
    EXPECT_EQ(r.value.plan[0].bytes(), 1039u);
}

TEST_F(ScannerTest, UnreadableContentStillProducesAPlan) {
    if (platform::is_superuser()) GTEST_SKIP() << "permissions are not enforced for root";

    write_file("app/node_modules/ok.js", 1000);
    write_file("app/node_modules/locked/secret.js", 50);
    lock(test_dir / "app/node_modules/locked");
    set_age(test_dir / "app/node_modules", days(4));

    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run();
    unlock(test_dir / "app/node_modules/locked");

    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.plan.size(), 1u);
    EXPECT_EQ(r.value.plan.total_bytes(), 1000u);
    EXPECT_EQ(r.value.warnings.size(), 1u);
}

TEST_F(ScannerTest, InvalidConfigIsRejected) {
    config.jobs = 0;
    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run();
    EXPECT_TRUE(r.is_err());
}

TEST_F(ScannerTest, CanceledScanReturnsEarly) {
    write_file("app/build/x.o", 10);
    set_age(test_dir / "app/build", days(9));

    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    scanner.cancel();
    auto r = scanner.run();
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.canceled);
    EXPECT_TRUE(r.value.plan.empty());
}

TEST_F(ScannerTest, ProgressCallbackSeesDirectories) {
    make_dir("app/src");
    std::vector<std::string> messages;
    auto catalog = derived_data_catalog();
    Scanner scanner(catalog, config);
    auto r = scanner.run([&](const std::string& m) { messages.push_back(m); });
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(messages.empty());
    EXPECT_EQ(r.value.directories_listed, messages.size());
}
