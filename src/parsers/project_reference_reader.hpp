#pragma once

#include "common/line_reader.hpp"
#include <optional>
#include <string>

namespace slnscan {

class PathResolverRegistry;

// Solution file block markers
constexpr const char* PROJECT_BLOCK_BEGIN = "Project";
constexpr const char* PROJECT_BLOCK_END = "EndProject";
constexpr const char* PROJECT_SECTION_END = "EndProjectSection";

// One Project ... EndProject block of a solution file
struct SolutionReference {
    std::string name;
    std::string relative_path;  // after path resolution
    std::string type_id;        // GUID without braces, as written
    std::string unique_id;      // GUID without braces, as written
};

bool operator==(const SolutionReference& a, const SolutionReference& b);

// Fields of a Project header line:
//   Project("{TYPE-GUID}") = "Name", "Path", "{UNIQUE-GUID}"
// Returns std::nullopt when line does not match the grammar.
std::optional<SolutionReference> parse_project_header(const std::string& line);

// Read the next project block. Lines before the block are skipped.
// Returns std::nullopt when input ends without another Project line.
// Throws MalformedProjectReferenceError on a header not matching the grammar,
// an EndProject without Project, or a Project without EndProject.
std::optional<SolutionReference> read_project_reference(LineReader& reader, int format_version,
                                                        const PathResolverRegistry& resolvers);

// Uses PathResolverRegistry::instance()
std::optional<SolutionReference> read_project_reference(LineReader& reader, int format_version);

// Consume lines through the EndProject closing the current block.
// Throws MalformedProjectReferenceError when input ends first.
void skip_to_project_end(LineReader& reader);

} // namespace slnscan
