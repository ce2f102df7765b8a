#include "pch.h"
#include "parsers/path_resolver.hpp"
#include "parsers/web_site_path_resolver.hpp"
#include "common/errors.hpp"
#include "common/project_types.hpp"
#include "common/string_utils.hpp"

namespace slnscan {

PathResolverRegistry& PathResolverRegistry::instance() {
    static PathResolverRegistry registry;
    return registry;
}

PathResolverRegistry::PathResolverRegistry() {
    // Web sites store a display URL in the header from Visual Studio 2012 on
    register_resolver(project_type::WEB_SITE, format_version::VS2012, []() {
        return std::make_unique<WebSitePathResolver>();
    });
}

void PathResolverRegistry::register_resolver(const std::string& type_id, int minimum_format_version,
                                             ResolverCreator creator) {
    if (is_blank(type_id)) {
        throw InvalidArgumentError("Invalid project type identifier: identifier is empty");
    }
    if (!creator) {
        throw InvalidArgumentError("Invalid path resolver for project type " + type_id);
    }
    int minimum = std::max(minimum_format_version, format_version::MINIMUM);
    resolvers_[to_upper(type_id)][minimum] = std::move(creator);
}

bool PathResolverRegistry::unregister_resolver(const std::string& type_id) {
    return resolvers_.erase(to_upper(type_id)) > 0;
}

const PathResolverRegistry::ResolverCreator* PathResolverRegistry::find(const std::string& type_id,
                                                                        int format_version) const {
    auto it = resolvers_.find(to_upper(type_id));
    if (it == resolvers_.end()) {
        return nullptr;
    }

    // Newest entry whose minimum does not exceed format_version
    const auto& by_version = it->second;
    auto version_it = by_version.upper_bound(format_version);
    if (version_it == by_version.begin()) {
        return nullptr;
    }
    --version_it;
    return &version_it->second;
}

std::unique_ptr<PathResolver> PathResolverRegistry::create(const std::string& type_id,
                                                           int format_version) const {
    const ResolverCreator* creator = find(type_id, format_version);
    if (!creator) {
        return nullptr;
    }
    return (*creator)();
}

bool PathResolverRegistry::has_resolver(const std::string& type_id, int format_version) const {
    return find(type_id, format_version) != nullptr;
}

} // namespace slnscan
