#pragma once

#include <string>
#include <vector>

namespace slnscan {

// Filesystem access used while locating Visual Studio files.
// Abstract so tests can substitute an in-memory view.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool file_exists(const std::string& path) const = 0;
    virtual bool directory_exists(const std::string& path) const = 0;
    virtual std::string current_directory() const = 0;

    // Files in directory whose names match pattern ('*' and '?' wildcards),
    // searching sub-directories when recursive is set. Sorted.
    virtual std::vector<std::string> list_files(const std::string& directory,
                                                const std::string& pattern,
                                                bool recursive) const = 0;
};

// std::filesystem backed implementation
class DiskFileSystem : public FileSystem {
public:
    static const DiskFileSystem& instance();

    bool file_exists(const std::string& path) const override;
    bool directory_exists(const std::string& path) const override;
    std::string current_directory() const override;
    std::vector<std::string> list_files(const std::string& directory,
                                        const std::string& pattern,
                                        bool recursive) const override;
};

// Wildcard helpers
bool has_wildcard(const std::string& path);
std::string add_asterisk(const std::string& extension);       // ".cs" -> "*.cs"
bool matches_wildcard(const std::string& name, const std::string& pattern);

// Path helpers. Visual Studio files store Windows separators.
std::string to_native_separators(const std::string& path);
std::string combine_path(const std::string& directory, const std::string& relative);

} // namespace slnscan
