#include <gtest/gtest.h>
#include <core/time_utils.hpp>
#include <cctype>

using namespace std::chrono;

static const system_clock::time_point NOW = system_clock::time_point(seconds(1'750'000'000));

TEST(TimeUtils, FormatAgeNow) {
    EXPECT_EQ(format_age(NOW, NOW), "now");
    EXPECT_EQ(format_age(NOW - seconds(59), NOW), "now");
}

TEST(TimeUtils, FormatAgeMinutes) {
    EXPECT_EQ(format_age(NOW - minutes(5), NOW), "5m");
    EXPECT_EQ(format_age(NOW - seconds(119), NOW), "1m");
}

TEST(TimeUtils, FormatAgeHours) {
    // 3 hours 59 minutes rounds down
    EXPECT_EQ(format_age(NOW - hours(3) - minutes(59), NOW), "3h");
}

TEST(TimeUtils, FormatAgeDays) {
    EXPECT_EQ(format_age(NOW - days(2), NOW), "2d");
    EXPECT_EQ(format_age(NOW - days(400) - hours(5), NOW), "400d");
}

TEST(TimeUtils, FormatAgeFuture) {
    EXPECT_EQ(format_age(NOW + hours(1), NOW), "now");
}

TEST(TimeUtils, FormatSystemTimeBeforeEpoch) {
    EXPECT_EQ(format_system_time(system_clock::time_point(seconds(-10))), "-");
}

TEST(TimeUtils, FormatSystemTimeShape) {
    // Local time zone varies, so only the layout is fixed
    std::string s = format_system_time(NOW);
    ASSERT_EQ(s.size(), 16u);
    EXPECT_EQ(s.substr(0, 3), "202");
    EXPECT_EQ(s[4], '-');
    EXPECT_EQ(s[7], '-');
    EXPECT_EQ(s[10], ' ');
    EXPECT_EQ(s[13], ':');
    for (size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u, 11u, 12u, 14u, 15u}) {
        EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(s[i]))) << s;
    }
}

TEST(TimeUtils, Days) {
    EXPECT_EQ(days(0), seconds(0));
    EXPECT_EQ(days(2), seconds(172800));
}
