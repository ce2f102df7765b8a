#include "pch.h"
#include "common/file_system.hpp"
#include "common/errors.hpp"

namespace fs = std::filesystem;

namespace slnscan {

const DiskFileSystem& DiskFileSystem::instance() {
    static DiskFileSystem file_system;
    return file_system;
}

bool DiskFileSystem::file_exists(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool DiskFileSystem::directory_exists(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::string DiskFileSystem::current_directory() const {
    return fs::current_path().string();
}

std::vector<std::string> DiskFileSystem::list_files(const std::string& directory,
                                                    const std::string& pattern,
                                                    bool recursive) const {
    std::vector<std::string> files;
    if (!directory_exists(directory)) {
        return files;
    }

    auto collect = [&](const fs::directory_entry& entry) {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) && matches_wildcard(entry.path().filename().string(), pattern)) {
            files.push_back(entry.path().string());
        }
    };

    // Unreadable sub-directories are skipped
    std::error_code ec;
    if (recursive) {
        fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            collect(*it);
        }
    } else {
        fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            collect(*it);
        }
    }
    if (ec) {
        throw Error("Failed to list directory " + directory + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool has_wildcard(const std::string& path) {
    return path.find_first_of("*?") != std::string::npos;
}

std::string add_asterisk(const std::string& extension) {
    return "*" + extension;
}

bool matches_wildcard(const std::string& name, const std::string& pattern) {
    // Translate the wildcard pattern to a regex, escaping everything else
    std::string expr;
    for (char c : pattern) {
        switch (c) {
            case '*': expr += ".*"; break;
            case '?': expr += "."; break;
            case '.': case '\\': case '+': case '^': case '$': case '(': case ')':
            case '[': case ']': case '{': case '}': case '|':
                expr += '\\';
                expr += c;
                break;
            default:
                expr += c;
                break;
        }
    }
    std::regex re(expr, std::regex::ECMAScript | std::regex::icase);
    return std::regex_match(name, re);
}

std::string to_native_separators(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', static_cast<char>(fs::path::preferred_separator));
    return result;
}

std::string combine_path(const std::string& directory, const std::string& relative) {
    // Plain join: the relative part is kept as written
    fs::path p(to_native_separators(relative));
    if (p.is_absolute() || directory.empty()) {
        return p.string();
    }
    return (fs::path(to_native_separators(directory)) / p).string();
}

} // namespace slnscan
