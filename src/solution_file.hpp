#pragma once

#include "common/line_reader.hpp"
#include "common/project_types.hpp"
#include "parsers/project_reference_reader.hpp"
#include <string>
#include <vector>

namespace slnscan {

// A Visual Studio solution file and the project references it resolves to.
//
// load() reads the header and every Project block, then sorts references
// into per-language project files and web site directories; relative paths
// are combined with the solution's directory. References of other project
// types are kept in references() only.
//
// Every load() starts by clearing previous results. Results are committed
// only when the whole file was read, so after a failed load() all buckets are
// empty and format_version() is 0.
class SolutionFile {
public:
    explicit SolutionFile(const std::string& filepath,
                          const FileSystem& file_system = DiskFileSystem::instance(),
                          LineReaderFactory reader_factory = file_line_reader_factory());

    // Throws NotFoundError, WrongExtensionError and the solution format errors
    void load();

    const FileInfo& file() const { return file_; }
    int format_version() const { return format_version_; }

    const std::vector<SolutionReference>& references() const { return references_; }
    const std::vector<ProjectFile>& basic_project_files() const { return basic_project_files_; }
    const std::vector<ProjectFile>& csharp_project_files() const { return csharp_project_files_; }
    const std::vector<ProjectFile>& fsharp_project_files() const { return fsharp_project_files_; }
    const std::vector<WebSiteDirectory>& web_site_directories() const { return web_site_directories_; }

private:
    void clear();

    FileInfo file_;
    const FileSystem& file_system_;
    LineReaderFactory reader_factory_;

    int format_version_ = 0;
    std::vector<SolutionReference> references_;
    std::vector<ProjectFile> basic_project_files_;
    std::vector<ProjectFile> csharp_project_files_;
    std::vector<ProjectFile> fsharp_project_files_;
    std::vector<WebSiteDirectory> web_site_directories_;
};

} // namespace slnscan
