#include "pch.h"
#include "parsers/web_site_scanner.hpp"
#include "common/errors.hpp"

namespace slnscan {

void load_web_site_directory(WebSiteDirectory& site, const FileSystem& file_system) {
    if (!file_system.directory_exists(site.path)) {
        throw NotFoundError("Directory not found at path: " + site.path);
    }

    site.basic_source_files.clear();
    site.csharp_source_files.clear();

    for (const auto& path : file_system.list_files(site.path, add_asterisk(BASIC_SOURCE_EXTENSION), true)) {
        site.basic_source_files.push_back(make_source_file(Language::Basic, path, file_system));
    }
    for (const auto& path : file_system.list_files(site.path, add_asterisk(CSHARP_SOURCE_EXTENSION), true)) {
        site.csharp_source_files.push_back(make_source_file(Language::CSharp, path, file_system));
    }
}

} // namespace slnscan
