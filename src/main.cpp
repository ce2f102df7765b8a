#include "pch.h"
#include "visual_studio_files.hpp"
#include "parsers/project_file_reader.hpp"
#include "parsers/web_site_scanner.hpp"
#include <cstring>

namespace {

void print_usage(const char* program_name) {
    std::cout << "slnscan - Visual Studio solution and project file scanner\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [options] <file>...\n\n";
    std::cout << "Files may be .sln, .csproj, .vbproj, .fsproj, .cs, .vb or .fs and may use\n";
    std::cout << "'*' and '?' wildcards in the file name.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -r, --recursive        Search sub-directories when expanding wildcards\n";
    std::cout << "  -s, --sources          List the source files of every project and web site\n";
    std::cout << "  -h, --help             Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " MySolution.sln\n";
    std::cout << "  " << program_name << " --sources --recursive \"src/*.sln\"\n";
}

void print_sources(const std::vector<slnscan::SourceFile>& sources, const char* indent) {
    for (const auto& source : sources) {
        std::cout << indent << source.file.path << "\n";
    }
}

void print_project(slnscan::ProjectFile& project, bool list_sources) {
    std::cout << "    " << project.name << " -> " << project.file.path << "\n";
    if (!list_sources) {
        return;
    }
    try {
        slnscan::load_project_file(project);
        print_sources(project.source_files, "      ");
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to read project " << project.name << ": " << e.what() << "\n";
    }
}

void print_web_site(slnscan::WebSiteDirectory& site, bool list_sources) {
    std::cout << "    " << site.name << " -> " << site.path << "\n";
    if (!list_sources) {
        return;
    }
    try {
        slnscan::load_web_site_directory(site);
        print_sources(site.basic_source_files, "      ");
        print_sources(site.csharp_source_files, "      ");
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to scan web site " << site.name << ": " << e.what() << "\n";
    }
}

void print_projects(const char* title, std::vector<slnscan::ProjectFile> projects, bool list_sources) {
    if (projects.empty()) {
        return;
    }
    std::cout << "  " << title << " (" << projects.size() << "):\n";
    for (auto& project : projects) {
        print_project(project, list_sources);
    }
}

void print_solution(const slnscan::SolutionFile& solution, bool list_sources) {
    std::cout << "Solution: " << solution.file().path << "\n";
    std::cout << "  Format version: " << solution.format_version() << "\n";
    std::cout << "  References: " << solution.references().size() << "\n";

    print_projects("Basic projects", solution.basic_project_files(), list_sources);
    print_projects("C# projects", solution.csharp_project_files(), list_sources);
    print_projects("F# projects", solution.fsharp_project_files(), list_sources);

    auto web_sites = solution.web_site_directories();
    if (!web_sites.empty()) {
        std::cout << "  Web sites (" << web_sites.size() << "):\n";
        for (auto& site : web_sites) {
            print_web_site(site, list_sources);
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<std::string> input_paths;
    bool recursive = false;
    bool list_sources = false;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-r") == 0 || strcmp(argv[i], "--recursive") == 0) {
            recursive = true;
        } else if (strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--sources") == 0) {
            list_sources = true;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Error: Unknown option: " << argv[i] << "\n";
            return 1;
        } else {
            input_paths.push_back(argv[i]);
        }
    }

    if (input_paths.empty()) {
        std::cerr << "Error: No input file specified\n";
        print_usage(argv[0]);
        return 1;
    }

    bool failed = false;

    // Locate files one argument at a time so a bad path does not hide the others
    for (const auto& input_path : input_paths) {
        try {
            slnscan::VisualStudioFiles files({input_path}, recursive);

            for (auto& solution : files.solution_files()) {
                try {
                    solution.load();
                    print_solution(solution, list_sources);
                } catch (const std::exception& e) {
                    std::cerr << "Error: " << e.what() << "\n";
                    failed = true;
                }
            }

            print_projects("Basic projects", files.basic_project_files(), list_sources);
            print_projects("C# projects", files.csharp_project_files(), list_sources);
            print_projects("F# projects", files.fsharp_project_files(), list_sources);

            for (const auto* sources : {&files.basic_source_files(), &files.csharp_source_files(),
                                        &files.fsharp_source_files()}) {
                print_sources(*sources, "");
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            failed = true;
        }
    }

    return failed ? 1 : 0;
}
