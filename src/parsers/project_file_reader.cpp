#include "pch.h"
#include "parsers/project_file_reader.hpp"
#include "common/errors.hpp"
#include "common/string_utils.hpp"
#include "pugixml.hpp"

namespace slnscan {

namespace {

bool is_auto_generated(const pugi::xml_node& compile) {
    auto auto_gen = compile.child("AutoGen");
    if (!auto_gen) return false;
    return equals_ignore_case(trim(auto_gen.text().as_string()), "true");
}

} // namespace

void load_project_file(ProjectFile& project, const FileSystem& file_system) {
    const char* source_extension = source_file_extension(project.language);

    check_file(project.file, project_file_extension(project.language), file_system);
    project.source_files.clear();

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(project.file.path.c_str());
    if (!result) {
        throw MalformedProjectFileError("Failed to parse project file " + project.file.path +
                                        ": " + std::string(result.description()));
    }

    auto root = doc.child("Project");
    if (!root) {
        throw MalformedProjectFileError("Invalid project file " + project.file.path +
                                        ": no Project root element");
    }

    for (auto item_group : root.children("ItemGroup")) {
        for (auto compile : item_group.children("Compile")) {
            if (is_auto_generated(compile)) {
                continue;
            }

            std::string include = compile.attribute("Include").as_string();
            if (include.empty() || !ends_with_ignore_case(include, source_extension)) {
                continue;
            }

            project.source_files.push_back(
                make_source_file(project.language, combine_path(project.file.directory, include),
                                 file_system));
        }
    }

#ifndef NDEBUG
    std::cout << "[DEBUG] " << project.name << ": " << project.source_files.size()
              << " source file(s)\n";
#endif
}

} // namespace slnscan
