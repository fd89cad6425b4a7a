//! # Imports Implementation

#include "analysis/imports.hpp"

#include "log/log.hpp"

namespace wrapgen::analysis {

void Imports::add(ImportGroup group, std::optional<Version> version) {
    if (version && min_cfg_version_ && *version <= *min_cfg_version_) {
        version.reset();
    }

    auto it = map_.find(group);
    if (it == map_.end()) {
        WRAPGEN_LOG_TRACE("analysis", "require " << import_group_name(group) << " since "
                                                 << (version ? version->to_string() : "any"));
        map_.emplace(group, version);
        return;
    }

    auto& current = it->second;
    if (!current)
        return;
    if (!version || *version < *current) {
        current = version;
    }
}

} // namespace wrapgen::analysis
