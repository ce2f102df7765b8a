#include "pch.h"
#include "solution_file.hpp"
#include "parsers/solution_header.hpp"
#include "common/errors.hpp"

namespace slnscan {

SolutionFile::SolutionFile(const std::string& filepath, const FileSystem& file_system,
                           LineReaderFactory reader_factory)
    : file_(describe_file(filepath, file_system)),
      file_system_(file_system),
      reader_factory_(std::move(reader_factory)) {
    if (!reader_factory_) {
        throw InvalidArgumentError("Invalid line reader factory for " + filepath);
    }
}

void SolutionFile::clear() {
    format_version_ = 0;
    references_.clear();
    basic_project_files_.clear();
    csharp_project_files_.clear();
    fsharp_project_files_.clear();
    web_site_directories_.clear();
}

void SolutionFile::load() {
    clear();
    check_file(file_, SOLUTION_FILE_EXTENSION, file_system_);

    std::vector<SolutionReference> references;
    std::vector<ProjectFile> basic_projects, csharp_projects, fsharp_projects;
    std::vector<WebSiteDirectory> web_sites;
    int format_version = 0;

    {
        std::unique_ptr<LineReader> reader = reader_factory_(file_.path);
        format_version = read_solution_header(*reader);

        while (auto reference = read_project_reference(*reader, format_version)) {
            std::string path = combine_path(file_.directory, reference->relative_path);

            if (is_project_type(reference->type_id, project_type::BASIC)) {
                basic_projects.push_back(make_project_file(Language::Basic, reference->name, path, file_system_));
            } else if (is_project_type(reference->type_id, project_type::CSHARP)) {
                csharp_projects.push_back(make_project_file(Language::CSharp, reference->name, path, file_system_));
            } else if (is_project_type(reference->type_id, project_type::FSHARP)) {
                fsharp_projects.push_back(make_project_file(Language::FSharp, reference->name, path, file_system_));
            } else if (is_project_type(reference->type_id, project_type::WEB_SITE)) {
                web_sites.push_back(make_web_site_directory(reference->name, path));
            } else {
#ifndef NDEBUG
                std::cout << "[DEBUG] Skipping " << reference->name
                          << " (unsupported project type {" << reference->type_id << "})\n";
#endif
            }

            references.push_back(std::move(*reference));
        }
    }

#ifndef NDEBUG
    std::cout << "[DEBUG] " << file_.file_name << ": " << references.size()
              << " project reference(s)\n";
#endif

    format_version_ = format_version;
    references_ = std::move(references);
    basic_project_files_ = std::move(basic_projects);
    csharp_project_files_ = std::move(csharp_projects);
    fsharp_project_files_ = std::move(fsharp_projects);
    web_site_directories_ = std::move(web_sites);
}

} // namespace slnscan
