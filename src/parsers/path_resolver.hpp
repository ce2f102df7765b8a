#pragma once

#include "common/line_reader.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace slnscan {

// Per project type logic recovering the real relative path of a project
// reference whose header path is not usable as is.
//
// resolve() is called with the reader positioned just after the Project
// header line. It owns the rest of the block: on return the reader is
// positioned after the closing EndProject line.
class PathResolver {
public:
    virtual ~PathResolver() = default;

    virtual std::string resolve(LineReader& reader) = 0;
};

// Table of path resolvers keyed by (type identifier, minimum format version)
class PathResolverRegistry {
public:
    using ResolverCreator = std::function<std::unique_ptr<PathResolver>()>;

    // Get singleton instance
    static PathResolverRegistry& instance();

    // Register a resolver for type_id, eligible from minimum_format_version on.
    // The minimum is raised to format_version::MINIMUM when lower.
    void register_resolver(const std::string& type_id, int minimum_format_version,
                           ResolverCreator creator);

    // Remove every resolver registered for type_id. Returns false when there was none.
    bool unregister_resolver(const std::string& type_id);

    // Create the resolver applying to a reference. Returns nullptr when the
    // header path is used unchanged.
    std::unique_ptr<PathResolver> create(const std::string& type_id, int format_version) const;

    bool has_resolver(const std::string& type_id, int format_version) const;

private:
    PathResolverRegistry();
    PathResolverRegistry(const PathResolverRegistry&) = delete;
    PathResolverRegistry& operator=(const PathResolverRegistry&) = delete;

    const ResolverCreator* find(const std::string& type_id, int format_version) const;

    // upper-case type_id -> minimum format version -> creator
    std::map<std::string, std::map<int, ResolverCreator>> resolvers_;
};

} // namespace slnscan
