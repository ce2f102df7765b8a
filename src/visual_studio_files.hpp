#pragma once

#include "common/project_types.hpp"
#include "solution_file.hpp"
#include <string>
#include <vector>

namespace slnscan {

// Sorts a list of file paths into Visual Studio file kinds by extension.
//
// A path may hold '*' and '?' in its file name part; such paths are expanded
// in their directory (and sub-directories when recursive). Paths with
// wildcards in the directory part and unsupported extensions are skipped.
// Files are located, not loaded.
class VisualStudioFiles {
public:
    // Throws InvalidArgumentError for a blank path, NotFoundError for a
    // missing file
    VisualStudioFiles(const std::vector<std::string>& filepaths, bool recursive = false,
                      const FileSystem& file_system = DiskFileSystem::instance());

    const std::vector<ProjectFile>& basic_project_files() const { return basic_project_files_; }
    const std::vector<ProjectFile>& csharp_project_files() const { return csharp_project_files_; }
    const std::vector<ProjectFile>& fsharp_project_files() const { return fsharp_project_files_; }
    const std::vector<SourceFile>& basic_source_files() const { return basic_source_files_; }
    const std::vector<SourceFile>& csharp_source_files() const { return csharp_source_files_; }
    const std::vector<SourceFile>& fsharp_source_files() const { return fsharp_source_files_; }
    const std::vector<SolutionFile>& solution_files() const { return solution_files_; }
    std::vector<SolutionFile>& solution_files() { return solution_files_; }

    static bool is_supported_extension(const std::string& extension);

private:
    void add(const std::string& filepath);
    void add_file(const std::string& filepath, const std::string& extension);

    const FileSystem& file_system_;
    bool recursive_;

    std::vector<ProjectFile> basic_project_files_;
    std::vector<ProjectFile> csharp_project_files_;
    std::vector<ProjectFile> fsharp_project_files_;
    std::vector<SourceFile> basic_source_files_;
    std::vector<SourceFile> csharp_source_files_;
    std::vector<SourceFile> fsharp_source_files_;
    std::vector<SolutionFile> solution_files_;
};

} // namespace slnscan
