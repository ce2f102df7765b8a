#include "pch.h"
#include "common/string_utils.hpp"

namespace slnscan {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_blank(const std::string& str) {
    return str.find_first_not_of(" \t\r\n") == std::string::npos;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

bool equals_ignore_case(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

bool ends_with_ignore_case(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return equals_ignore_case(str.substr(str.size() - suffix.size()), suffix);
}

} // namespace slnscan
