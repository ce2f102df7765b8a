#include "pch.h"
#include "parsers/project_reference_reader.hpp"
#include "parsers/path_resolver.hpp"
#include "common/errors.hpp"
#include "common/string_utils.hpp"

namespace slnscan {

bool operator==(const SolutionReference& a, const SolutionReference& b) {
    return a.name == b.name && a.relative_path == b.relative_path &&
           a.type_id == b.type_id && a.unique_id == b.unique_id;
}

std::optional<SolutionReference> parse_project_header(const std::string& line) {
    // Project("{TYPE-GUID}") = "Name", "Path", "{UNIQUE-GUID}"
    static const std::regex header_re(
        R"xxx(^Project\("\{([A-Fa-f0-9-]+)\}"\) = "(.+)", "(.+)", "\{([A-Fa-f0-9-]+)\}"$)xxx");

    std::smatch match;
    if (!std::regex_match(line, match, header_re)) {
        return std::nullopt;
    }

    SolutionReference reference;
    reference.type_id = match[1].str();
    reference.name = match[2].str();
    reference.relative_path = match[3].str();
    reference.unique_id = match[4].str();
    return reference;
}

void skip_to_project_end(LineReader& reader) {
    while (reader.has_more()) {
        if (reader.read_line() == PROJECT_BLOCK_END) {
            return;
        }
    }
    throw_format_error<MalformedProjectReferenceError>(reader.source_name(), reader.line_number(),
                                                       "project reference is missing EndProject");
}

std::optional<SolutionReference> read_project_reference(LineReader& reader, int format_version,
                                                        const PathResolverRegistry& resolvers) {
    std::optional<SolutionReference> reference;
    int begin_line = 0;

    while (reader.has_more()) {
        std::string line = reader.read_line();

        if (starts_with(line, PROJECT_BLOCK_BEGIN)) {
            if (reference) {
                throw_format_error<MalformedProjectReferenceError>(
                    reader.source_name(), reader.line_number(),
                    "project reference opened at line " + std::to_string(begin_line) +
                    " is missing EndProject");
            }

            reference = parse_project_header(line);
            if (!reference) {
                throw_format_error<MalformedProjectReferenceError>(
                    reader.source_name(), reader.line_number(),
                    "invalid project reference: " + line);
            }
            begin_line = reader.line_number();

            if (auto resolver = resolvers.create(reference->type_id, format_version)) {
                // The resolver consumes the block through EndProject
                reference->relative_path = resolver->resolve(reader);
                return reference;
            }
        } else if (line == PROJECT_BLOCK_END) {
            if (!reference) {
                throw_format_error<MalformedProjectReferenceError>(
                    reader.source_name(), reader.line_number(),
                    "EndProject without matching Project");
            }
            return reference;
        }
    }

    if (reference) {
        throw_format_error<MalformedProjectReferenceError>(
            reader.source_name(), begin_line,
            "project reference '" + reference->name + "' is missing EndProject");
    }
    return std::nullopt;
}

std::optional<SolutionReference> read_project_reference(LineReader& reader, int format_version) {
    return read_project_reference(reader, format_version, PathResolverRegistry::instance());
}

} // namespace slnscan
