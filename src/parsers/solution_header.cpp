#include "pch.h"
#include "parsers/solution_header.hpp"
#include "common/errors.hpp"
#include "common/string_utils.hpp"

namespace slnscan {

namespace {

const std::string UTF8_BOM = "\xEF\xBB\xBF";

std::string strip_header_noise(const std::string& line) {
    std::string result = line;
    if (starts_with(result, UTF8_BOM)) {
        result = result.substr(UTF8_BOM.size());
    }
    return trim(result);
}

} // namespace

bool has_solution_header(const std::string& line) {
    if (is_blank(line)) return false;
    return starts_with(strip_header_noise(line), SOLUTION_HEADER_PREFIX);
}

std::optional<int> parse_major_version(const std::string& version) {
    // major.minor[.build[.revision]]
    static const std::regex version_re(R"(^(\d+)\.\d+(\.\d+){0,2}$)");
    std::smatch match;
    std::string trimmed = trim(version);
    if (!std::regex_match(trimmed, match, version_re)) {
        return std::nullopt;
    }
    try {
        return std::stoi(match[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int read_solution_header(LineReader& reader) {
    std::string line;
    bool found = false;

    for (int i = 0; i < SOLUTION_HEADER_MAX_LINES && reader.has_more(); i++) {
        line = reader.read_line();
        if (has_solution_header(line)) {
            found = true;
            break;
        }
    }

    if (!found) {
        throw_format_error<MalformedSolutionFileError>(reader.source_name(), reader.line_number(),
                                                       "not a Visual Studio solution file (header missing)");
    }

    std::string header = strip_header_noise(line);
    std::string version = header.substr(std::string(SOLUTION_HEADER_PREFIX).size());

    auto major = parse_major_version(version);
    if (!major) {
        throw_format_error<MalformedHeaderError>(reader.source_name(), reader.line_number(),
                                                 "invalid solution file format version '" + trim(version) + "'");
    }

#ifndef NDEBUG
    std::cout << "[DEBUG] Solution format version: " << *major << "\n";
#endif

    return *major;
}

} // namespace slnscan
