#pragma once

#include "common/file_system.hpp"
#include <string>
#include <vector>

namespace slnscan {

// Source languages with project-file support
enum class Language {
    Basic,
    CSharp,
    FSharp
};

// File extensions
constexpr const char* SOLUTION_FILE_EXTENSION = ".sln";
constexpr const char* BASIC_PROJECT_EXTENSION = ".vbproj";
constexpr const char* CSHARP_PROJECT_EXTENSION = ".csproj";
constexpr const char* FSHARP_PROJECT_EXTENSION = ".fsproj";
constexpr const char* BASIC_SOURCE_EXTENSION = ".vb";
constexpr const char* CSHARP_SOURCE_EXTENSION = ".cs";
constexpr const char* FSHARP_SOURCE_EXTENSION = ".fs";

// Project type identifiers found in solution files
namespace project_type {
constexpr const char* BASIC = "F184B08F-C81C-45F6-A57F-5ABD9991F28F";
constexpr const char* CSHARP = "FAE04EC0-301F-11D3-BF4B-00C04F79EFBC";
constexpr const char* FSHARP = "F2A71F9B-5D33-465A-A702-920D77279786";
constexpr const char* WEB_SITE = "E24C65DC-7377-472B-9ABA-BC803B73C61A";
} // namespace project_type

// Solution file format versions (major component of the header version)
namespace format_version {
constexpr int VS2002 = 7;
constexpr int VS2003 = 8;
constexpr int VS2005 = 9;
constexpr int VS2008 = 10;
constexpr int VS2010 = 11;
constexpr int VS2012 = 12;     // also written by every later Visual Studio
constexpr int MINIMUM = VS2002;
} // namespace format_version

const char* project_file_extension(Language language);
const char* source_file_extension(Language language);
const char* language_name(Language language);

// Type identifiers compare case-insensitively
bool is_project_type(const std::string& type_id, const char* expected);

// Location of a file on disk
struct FileInfo {
    std::string path;           // native separators
    std::string directory;      // containing directory, current directory when path has none
    std::string file_name;      // "App.csproj"
    std::string stem;           // "App"
    std::string extension;      // ".csproj"
};

// Describe path. Throws InvalidArgumentError when path is blank.
FileInfo describe_file(const std::string& path, const FileSystem& file_system);

// Validation gate run before a file is read.
// Throws NotFoundError / WrongExtensionError.
void check_file(const FileInfo& file, const std::string& expected_extension,
                const FileSystem& file_system);

// Source file entry
struct SourceFile {
    Language language = Language::CSharp;
    FileInfo file;
};

// Project file entry; source_files is filled by load_project_file()
struct ProjectFile {
    Language language = Language::CSharp;
    std::string name;
    FileInfo file;
    std::vector<SourceFile> source_files;
};

// Web site entry; source lists are filled by load_web_site_directory()
struct WebSiteDirectory {
    std::string name;
    std::string path;
    std::vector<SourceFile> basic_source_files;
    std::vector<SourceFile> csharp_source_files;
};

SourceFile make_source_file(Language language, const std::string& path,
                            const FileSystem& file_system = DiskFileSystem::instance());

// name falls back to the file stem when blank
ProjectFile make_project_file(Language language, const std::string& name, const std::string& path,
                              const FileSystem& file_system = DiskFileSystem::instance());

// One trailing separator is dropped from path.
// Throws InvalidArgumentError when name or path is blank
WebSiteDirectory make_web_site_directory(const std::string& name, const std::string& path);

bool operator==(const FileInfo& a, const FileInfo& b);
bool operator==(const SourceFile& a, const SourceFile& b);
bool operator==(const ProjectFile& a, const ProjectFile& b);
bool operator==(const WebSiteDirectory& a, const WebSiteDirectory& b);

} // namespace slnscan
