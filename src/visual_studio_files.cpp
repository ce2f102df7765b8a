#include "pch.h"
#include "visual_studio_files.hpp"
#include "common/errors.hpp"
#include "common/string_utils.hpp"

namespace fs = std::filesystem;

namespace slnscan {

namespace {

const std::vector<std::string> SUPPORTED_EXTENSIONS = {
    BASIC_PROJECT_EXTENSION,
    BASIC_SOURCE_EXTENSION,
    CSHARP_PROJECT_EXTENSION,
    CSHARP_SOURCE_EXTENSION,
    FSHARP_PROJECT_EXTENSION,
    FSHARP_SOURCE_EXTENSION,
    SOLUTION_FILE_EXTENSION
};

} // namespace

VisualStudioFiles::VisualStudioFiles(const std::vector<std::string>& filepaths, bool recursive,
                                     const FileSystem& file_system)
    : file_system_(file_system), recursive_(recursive) {
    for (const auto& filepath : filepaths) {
        add(filepath);
    }
}

bool VisualStudioFiles::is_supported_extension(const std::string& extension) {
    if (is_blank(extension)) return false;
    return std::any_of(SUPPORTED_EXTENSIONS.begin(), SUPPORTED_EXTENSIONS.end(),
                       [&](const std::string& supported) { return equals_ignore_case(extension, supported); });
}

void VisualStudioFiles::add(const std::string& filepath) {
    if (is_blank(filepath)) {
        throw InvalidArgumentError("Invalid file path: path is empty");
    }

    fs::path p(to_native_separators(filepath));
    std::string directory = p.parent_path().string();
    if (is_blank(directory)) {
        directory = file_system_.current_directory();
    }

    if (has_wildcard(directory)) {
        std::cerr << "Warning: Wildcards in directory names are not supported: " << filepath << "\n";
        return;
    }

    std::string file_name = p.filename().string();
    if (has_wildcard(file_name)) {
        for (const auto& match : file_system_.list_files(directory, file_name, recursive_)) {
            add(match);
        }
        return;
    }

    std::string extension = to_lower(p.extension().string());
    if (!is_supported_extension(extension)) {
        return;
    }

    add_file(p.string(), extension);
}

void VisualStudioFiles::add_file(const std::string& filepath, const std::string& extension) {
    if (!file_system_.file_exists(filepath)) {
        throw NotFoundError("File not found at path: " + filepath);
    }

    if (extension == BASIC_PROJECT_EXTENSION) {
        basic_project_files_.push_back(make_project_file(Language::Basic, "", filepath, file_system_));
    } else if (extension == BASIC_SOURCE_EXTENSION) {
        basic_source_files_.push_back(make_source_file(Language::Basic, filepath, file_system_));
    } else if (extension == CSHARP_PROJECT_EXTENSION) {
        csharp_project_files_.push_back(make_project_file(Language::CSharp, "", filepath, file_system_));
    } else if (extension == CSHARP_SOURCE_EXTENSION) {
        csharp_source_files_.push_back(make_source_file(Language::CSharp, filepath, file_system_));
    } else if (extension == FSHARP_PROJECT_EXTENSION) {
        fsharp_project_files_.push_back(make_project_file(Language::FSharp, "", filepath, file_system_));
    } else if (extension == FSHARP_SOURCE_EXTENSION) {
        fsharp_source_files_.push_back(make_source_file(Language::FSharp, filepath, file_system_));
    } else if (extension == SOLUTION_FILE_EXTENSION) {
        solution_files_.emplace_back(filepath, file_system_);
    }
}

} // namespace slnscan
