//! # Type Analysis
//!
//! Runs special-function detection for one library type and applies the
//! rules that depend on the type's category:
//!
//! | Kind        | Rule                                                        |
//! |-------------|-------------------------------------------------------------|
//! | Record      | `copy` stays public when the record is reference counted    |
//! | Class       | `copy` stays public; hash/equal/compare stay public and are |
//! |             | not synthesized (object wrappers compare by identity)       |
//! | Enumeration | none                                                        |
//! | Bitfield    | none                                                        |
//!
//! A type whose policy disables `generate_display_trait` loses its Format
//! operation.

#ifndef WRAPGEN_ANALYSIS_TYPE_ANALYSIS_HPP
#define WRAPGEN_ANALYSIS_TYPE_ANALYSIS_HPP

#include "analysis/functions.hpp"
#include "analysis/imports.hpp"
#include "analysis/special_functions.hpp"
#include "config/config.hpp"
#include "library/library.hpp"

#include <vector>

namespace wrapgen::analysis {

/// Analyzes the functions of one type in place, adds the required
/// declaration groups to `imports` and returns the detected operations.
[[nodiscard]] auto analyze_type(std::vector<Function>& functions, library::TypeKind type_kind,
                                const config::ObjectConfig& policy, Imports& imports)
    -> specials::Infos;

} // namespace wrapgen::analysis

#endif // WRAPGEN_ANALYSIS_TYPE_ANALYSIS_HPP
