#pragma once

#include "common/project_types.hpp"

namespace slnscan {

// Fill project.source_files from the Compile items of an MSBuild project file.
// Items marked <AutoGen>true</AutoGen> and items whose extension differs from
// the project language's source extension are skipped.
// Throws NotFoundError, WrongExtensionError, MalformedProjectFileError.
void load_project_file(ProjectFile& project,
                       const FileSystem& file_system = DiskFileSystem::instance());

} // namespace slnscan
