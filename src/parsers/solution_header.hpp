#pragma once

#include "common/line_reader.hpp"
#include <optional>
#include <string>

namespace slnscan {

// Text every solution file starts with, followed by the format version
constexpr const char* SOLUTION_HEADER_PREFIX = "Microsoft Visual Studio Solution File, Format Version";

// The header may be preceded by one blank line (or a BOM-only line)
constexpr int SOLUTION_HEADER_MAX_LINES = 2;

// Read the solution header and return the major format version.
// Throws MalformedSolutionFileError when no header is found within the first
// two lines, MalformedHeaderError when the version cannot be parsed.
int read_solution_header(LineReader& reader);

// True when line carries the header prefix (surrounding whitespace and a UTF-8 BOM ignored)
bool has_solution_header(const std::string& line);

// Parse a dotted version ("12.00", "8.0.1") and return its major component
std::optional<int> parse_major_version(const std::string& version);

} // namespace slnscan
