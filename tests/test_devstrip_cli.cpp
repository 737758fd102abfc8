#include "temp_tree.hpp"
#include <cli/devstrip_cli.hpp>
#include <core/time_utils.hpp>
#include <cstdlib>

// Runs the whole command against a throwaway home and working directory.
class DevstripRunTest : public TempTree {
protected:
    fs::path home;
    fs::path work;

    void SetUp() override {
        TempTree::SetUp();
        home = make_dir("home");
        work = make_dir("work");

        const char* old_home = std::getenv("HOME");
        saved_home_ = old_home ? std::optional<std::string>(old_home) : std::nullopt;
        saved_cwd_ = fs::current_path();
        ::setenv("HOME", home.c_str(), 1);
        fs::current_path(work);
    }

    void TearDown() override {
        fs::current_path(saved_cwd_);
        if (saved_home_) ::setenv("HOME", saved_home_->c_str(), 1);
        else ::unsetenv("HOME");
        TempTree::TearDown();
    }

    int run(const CliOptions& opts, std::string& output) {
        ::testing::internal::CaptureStdout();
        DevstripCLI cli;
        int status = cli.run(opts);
        output = ::testing::internal::GetCapturedStdout();
        return status;
    }

    static CliOptions options(std::vector<std::string> args) {
        auto parsed = parse_args(args);
        EXPECT_TRUE(parsed.is_ok()) << parsed.error;
        return parsed.value;
    }

private:
    std::optional<std::string> saved_home_;
    fs::path saved_cwd_;
};

TEST_F(DevstripRunTest, DryRunDeletesNothing) {
    write_file("work/app/node_modules/lib/index.js", 4096);
    write_file("work/app/src/main.js", 10);
    set_age(work / "app/node_modules", days(10));

    std::string out;
    int status = run(options({"--dry-run", "--no-color"}), out);

    EXPECT_EQ(status, 0);
    EXPECT_NE(out.find("app/node_modules"), std::string::npos) << out;
    EXPECT_NE(out.find("Dry-run"), std::string::npos) << out;
    EXPECT_TRUE(fs::exists(work / "app/node_modules/lib/index.js"));
}

TEST_F(DevstripRunTest, YesRemovesWithoutPrompting) {
    write_file("work/app/build/out.o", 2048);
    write_file("work/app/src/main.c", 10);
    set_age(work / "app/build", days(10));

    std::string out;
    int status = run(options({"-y", "--no-color"}), out);

    EXPECT_EQ(status, 0) << out;
    EXPECT_NE(out.find("Removed 1 item(s); reclaimed approximately 2 KB."), std::string::npos)
        << out;
    EXPECT_FALSE(fs::exists(work / "app/build"));
    EXPECT_TRUE(fs::exists(work / "app/src/main.c"));
}

TEST_F(DevstripRunTest, NothingToCleanExitsZero) {
    write_file("work/app/src/main.c", 10);

    std::string out;
    EXPECT_EQ(run(options({"--no-color"}), out), 0);
    EXPECT_NE(out.find("No safe cleanup targets"), std::string::npos) << out;
}

TEST_F(DevstripRunTest, RecentArtifactsAreCounted) {
    write_file("work/app/build/out.o", 100);
    write_file("work/lib/dist/lib.js", 100);
    set_age(work / "lib/dist", days(5));

    std::string out;
    EXPECT_EQ(run(options({"--dry-run", "--no-color"}), out), 0);
    EXPECT_NE(out.find("Skipped 1 recent item(s) modified within the last 2 day(s)."),
              std::string::npos) << out;
    EXPECT_NE(out.find("lib/dist"), std::string::npos) << out;
}

TEST_F(DevstripRunTest, AllIncludesFutureTimestamps) {
    write_file("work/app/build/out.o", 512);
    fs::last_write_time(work / "app/build",
                        fs::file_time_type::clock::now() + std::chrono::hours(2));

    std::string out;
    EXPECT_EQ(run(options({"--all", "--dry-run", "--no-color"}), out), 0);
    EXPECT_NE(out.find("-> " + (work / "app/build").string()), std::string::npos) << out;
}

TEST_F(DevstripRunTest, MissingRootExitsOne) {
    std::string out;
    EXPECT_EQ(run(options({"--no-color", "does-not-exist"}), out), 1);
    EXPECT_NE(out.find("does not exist"), std::string::npos) << out;
}

TEST_F(DevstripRunTest, BadConfigFileExitsOne) {
    write_file("work/bad.yaml");
    { std::ofstream(work / "bad.yaml") << "min_age_days: soon\n"; }

    std::string out;
    EXPECT_EQ(run(options({"--no-color", "--config", "bad.yaml"}), out), 1);
    EXPECT_NE(out.find("Invalid config"), std::string::npos) << out;
}

TEST_F(DevstripRunTest, WriteConfigCreatesFile) {
    std::string out;
    EXPECT_EQ(run(options({"--write-config", "--no-color"}), out), 0);
    EXPECT_TRUE(fs::exists(home / ".devstrip/config.yaml"));
}
