//! # Imports
//!
//! The external declaration groups a type's generated code needs, each with
//! the library version that gates it. The emitter wraps each declaration in
//! a conditional-compilation guard equivalent to "library version >= V";
//! an entry without a version is unconditional.

#ifndef WRAPGEN_ANALYSIS_IMPORTS_HPP
#define WRAPGEN_ANALYSIS_IMPORTS_HPP

#include "version/version.hpp"

#include <cstddef>
#include <map>
#include <optional>

namespace wrapgen::analysis {

/// Declaration groups required by synthesized operations.
enum class ImportGroup {
    Ordering,    ///< Ordering support, for Compare
    Formatting,  ///< Formatting support, for Format
    Hashing,     ///< Hashing support, for Hash
    StaticString ///< Foreign non-owning string reference, for static stringify
};

inline const char* import_group_name(ImportGroup group) {
    switch (group) {
    case ImportGroup::Ordering:
        return "ordering";
    case ImportGroup::Formatting:
        return "formatting";
    case ImportGroup::Hashing:
        return "hashing";
    case ImportGroup::StaticString:
        return "static-string";
    }
    return "unknown";
}

/// Ordered set of required declaration groups.
class Imports {
public:
    Imports() = default;

    /// Gates at or below `min_cfg_version` are dropped: the library
    /// baseline already satisfies them.
    explicit Imports(std::optional<Version> min_cfg_version)
        : min_cfg_version_(min_cfg_version) {}

    /// Requires `group` from `version` on. When the group is already
    /// present the lower gate wins, and no gate is lower than any version.
    void add(ImportGroup group, std::optional<Version> version = std::nullopt);

    bool contains(ImportGroup group) const {
        return map_.count(group) != 0;
    }

    /// Gate of `group`. Empty when the group is absent or unconditional.
    std::optional<Version> version_of(ImportGroup group) const {
        auto it = map_.find(group);
        return it == map_.end() ? std::nullopt : it->second;
    }

    const std::map<ImportGroup, std::optional<Version>>& entries() const {
        return map_;
    }

    size_t size() const {
        return map_.size();
    }

    bool empty() const {
        return map_.empty();
    }

private:
    std::optional<Version> min_cfg_version_;
    std::map<ImportGroup, std::optional<Version>> map_;
};

} // namespace wrapgen::analysis

#endif // WRAPGEN_ANALYSIS_IMPORTS_HPP
