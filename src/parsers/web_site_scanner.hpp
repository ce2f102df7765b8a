#pragma once

#include "common/project_types.hpp"

namespace slnscan {

// Fill the source lists of a web site by scanning its directory tree for
// Basic and C# source files. Throws NotFoundError when the directory is missing.
void load_web_site_directory(WebSiteDirectory& site,
                             const FileSystem& file_system = DiskFileSystem::instance());

} // namespace slnscan
