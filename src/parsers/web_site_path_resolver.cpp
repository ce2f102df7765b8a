#include "pch.h"
#include "parsers/web_site_path_resolver.hpp"
#include "parsers/project_reference_reader.hpp"
#include "common/errors.hpp"
#include "common/string_utils.hpp"

namespace slnscan {

std::string WebSitePathResolver::resolve(LineReader& reader) {
    // KEY = "VALUE"
    static const std::regex key_value_re(R"xxx(^([^=]+) = "(.+)"$)xxx");

    while (reader.has_more()) {
        std::string line = trim(reader.read_line());

        if (line == PROJECT_SECTION_END || line == PROJECT_BLOCK_END) {
            break;
        }

        std::smatch match;
        if (std::regex_match(line, match, key_value_re) && trim(match[1].str()) == RELATIVE_PATH_KEY) {
            std::string path = match[2].str();
            skip_to_project_end(reader);
            return path;
        }
    }

    throw_format_error<MalformedProjectReferenceError>(reader.source_name(), reader.line_number(),
                                                       "web site reference has no " +
                                                       std::string(RELATIVE_PATH_KEY) + " entry");
}

} // namespace slnscan
