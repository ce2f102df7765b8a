#pragma once

#include "parsers/path_resolver.hpp"

namespace slnscan {

// Web site references carry a display name or URL in their header; the real
// path is the SlnRelativePath entry of the WebsiteProperties section:
//
//   Project("{E24C65DC-7377-472B-9ABA-BC803B73C61A}") = "WebSite", "http://localhost/WebSite", "{...}"
//       ProjectSection(WebsiteProperties) = preProject
//           SlnRelativePath = "WebSite\"
//       EndProjectSection
//   EndProject
class WebSitePathResolver : public PathResolver {
public:
    static constexpr const char* RELATIVE_PATH_KEY = "SlnRelativePath";

    std::string resolve(LineReader& reader) override;
};

} // namespace slnscan
