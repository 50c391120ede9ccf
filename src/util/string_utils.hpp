#pragma once

#include <string>
#include <vector>

namespace StringUtils {
// Split on every delimiter; empty fields are kept.
std::vector<std::string> split(const std::string& str, char delimiter);
std::string trim(const std::string& str);
}
