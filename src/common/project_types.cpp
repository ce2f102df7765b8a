#include "pch.h"
#include "common/project_types.hpp"
#include "common/errors.hpp"
#include "common/string_utils.hpp"

namespace fs = std::filesystem;

namespace slnscan {

const char* project_file_extension(Language language) {
    switch (language) {
        case Language::Basic:  return BASIC_PROJECT_EXTENSION;
        case Language::CSharp: return CSHARP_PROJECT_EXTENSION;
        case Language::FSharp: return FSHARP_PROJECT_EXTENSION;
    }
    return "";
}

const char* source_file_extension(Language language) {
    switch (language) {
        case Language::Basic:  return BASIC_SOURCE_EXTENSION;
        case Language::CSharp: return CSHARP_SOURCE_EXTENSION;
        case Language::FSharp: return FSHARP_SOURCE_EXTENSION;
    }
    return "";
}

const char* language_name(Language language) {
    switch (language) {
        case Language::Basic:  return "Basic";
        case Language::CSharp: return "C#";
        case Language::FSharp: return "F#";
    }
    return "";
}

bool is_project_type(const std::string& type_id, const char* expected) {
    return equals_ignore_case(type_id, expected);
}

FileInfo describe_file(const std::string& path, const FileSystem& file_system) {
    if (is_blank(path)) {
        throw InvalidArgumentError("Invalid file path: path is empty");
    }

    FileInfo info;
    info.path = to_native_separators(path);

    fs::path p(info.path);
    info.directory = p.parent_path().string();
    if (is_blank(info.directory)) {
        info.directory = file_system.current_directory();
    }
    info.file_name = p.filename().string();
    info.stem = p.stem().string();
    info.extension = p.extension().string();
    return info;
}

void check_file(const FileInfo& file, const std::string& expected_extension,
                const FileSystem& file_system) {
    if (!file_system.file_exists(file.path)) {
        throw NotFoundError("File not found at path: " + file.path);
    }
    if (!equals_ignore_case(file.extension, expected_extension)) {
        throw WrongExtensionError("Invalid file extension for " + file.path +
                                  ": expected " + expected_extension);
    }
}

SourceFile make_source_file(Language language, const std::string& path,
                            const FileSystem& file_system) {
    SourceFile source;
    source.language = language;
    source.file = describe_file(path, file_system);
    return source;
}

ProjectFile make_project_file(Language language, const std::string& name, const std::string& path,
                              const FileSystem& file_system) {
    ProjectFile project;
    project.language = language;
    project.file = describe_file(path, file_system);
    project.name = is_blank(name) ? project.file.stem : name;
    return project;
}

WebSiteDirectory make_web_site_directory(const std::string& name, const std::string& path) {
    if (is_blank(name)) {
        throw InvalidArgumentError("Invalid web site name: name is empty");
    }
    if (is_blank(path)) {
        throw InvalidArgumentError("Invalid web site path: path is empty");
    }

    WebSiteDirectory site;
    site.name = name;
    site.path = to_native_separators(path);
    // "WebSite\" and "WebSite" name the same directory
    if (site.path.size() > 1 && site.path.back() == fs::path::preferred_separator) {
        site.path.pop_back();
    }
    return site;
}

bool operator==(const FileInfo& a, const FileInfo& b) {
    return a.path == b.path && a.directory == b.directory && a.file_name == b.file_name &&
           a.stem == b.stem && a.extension == b.extension;
}

bool operator==(const SourceFile& a, const SourceFile& b) {
    return a.language == b.language && a.file == b.file;
}

bool operator==(const ProjectFile& a, const ProjectFile& b) {
    return a.language == b.language && a.name == b.name && a.file == b.file &&
           a.source_files == b.source_files;
}

bool operator==(const WebSiteDirectory& a, const WebSiteDirectory& b) {
    return a.name == b.name && a.path == b.path &&
           a.basic_source_files == b.basic_source_files &&
           a.csharp_source_files == b.csharp_source_files;
}

} // namespace slnscan
