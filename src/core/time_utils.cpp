#include "time_utils.hpp"
#include "constants.hpp"
#include <fmt/format.h>
#include <ctime>

std::string format_system_time(std::chrono::system_clock::time_point tp) {
    if (tp < std::chrono::system_clock::time_point{}) return "-";

    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf);
    return std::string(buf);
}

std::string format_age(std::chrono::system_clock::time_point tp,
                       std::chrono::system_clock::time_point now) {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - tp).count();
    if (elapsed < 60) return "now";

    long long mins = elapsed / 60;
    long long hours = elapsed / 3600;
    long long d = elapsed / SECONDS_PER_DAY;

    if (d > 0) {
        return fmt::format("{}d", d);
    } else if (hours > 0) {
        return fmt::format("{}h", hours);
    } else {
        return fmt::format("{}m", mins);
    }
}

std::chrono::seconds days(long long n) {
    return std::chrono::seconds(n * SECONDS_PER_DAY);
}
