#include "pch.h"
#include "common/errors.hpp"

namespace slnscan {

std::string format_error_message(const std::string& file, int line, const std::string& message) {
    if (file.empty()) {
        return "line " + std::to_string(line) + ": error: " + message;
    }
    return file + "(" + std::to_string(line) + "): error: " + message;
}

} // namespace slnscan
