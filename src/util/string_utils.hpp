#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, char delimiter);
std::string trim(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);
std::string to_lower(std::string str);
}
