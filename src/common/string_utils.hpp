#pragma once

#include <string>

namespace slnscan {

// Strip spaces, tabs, CR and LF from both ends
std::string trim(const std::string& str);

std::string to_upper(const std::string& str);
std::string to_lower(const std::string& str);

bool is_blank(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool equals_ignore_case(const std::string& a, const std::string& b);
bool ends_with_ignore_case(const std::string& str, const std::string& suffix);

} // namespace slnscan
