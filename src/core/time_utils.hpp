#pragma once

#include <string>
#include <chrono>

// Format a point in time as local "YYYY-MM-DD HH:MM". Returns "-" for
// times before the Unix epoch.
std::string format_system_time(std::chrono::system_clock::time_point tp);

// Format the time elapsed between `tp` and `now` as "3d", "5h", "12m" or "now".
std::string format_age(std::chrono::system_clock::time_point tp,
                       std::chrono::system_clock::time_point now);

// Whole days to a duration.
std::chrono::seconds days(long long n);
