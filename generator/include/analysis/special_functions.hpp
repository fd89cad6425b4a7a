//! # Special Functions
//!
//! Detects the functions of a library type that implement conventional
//! operations (equality, ordering, hashing, reference counting, destruction,
//! cloning, formatting) from their names and signature shapes, so the
//! emitter can synthesize the matching high-level operations instead of
//! exposing the raw C functions.
//!
//! ## Passes
//!
//! - `extract`: classifies a type's function list in place and returns the
//!   registry of detected operations
//! - `unhide`: makes the source function of an operation public again
//! - `analyze_imports`: records the declaration groups the synthesized
//!   operations need, each gated at its minimum library version
//!
//! ## Usage
//!
//! ```cpp
//! auto infos = specials::extract(functions, library::TypeKind::Record, policy);
//! if (infos.has_trait(specials::Kind::RefIncrement)) {
//!     specials::unhide(functions, infos, specials::Kind::Clone);
//! }
//! specials::analyze_imports(infos, imports);
//! ```

#ifndef WRAPGEN_ANALYSIS_SPECIAL_FUNCTIONS_HPP
#define WRAPGEN_ANALYSIS_SPECIAL_FUNCTIONS_HPP

#include "analysis/functions.hpp"
#include "analysis/imports.hpp"
#include "config/config.hpp"
#include "library/library.hpp"
#include "version/version.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wrapgen::analysis::specials {

// ============================================================================
// Operation Vocabulary
// ============================================================================

/// Conventional operations a C function can implement.
/// Declaration order is the registry's iteration order.
enum class Kind {
    Compare,      ///< `compare`: total ordering
    Clone,        ///< `copy`: deep copy
    Equal,        ///< `equal`, `is_equal`
    Destroy,      ///< `free`, `destroy`
    RefIncrement, ///< `ref`, `ref_`
    RefDecrement, ///< `unref`
    Format,       ///< Human-readable string conversion
    Hash          ///< `hash`
};

/// Parses a function name against the operation vocabulary (case-exact).
/// Returns std::nullopt for names outside the vocabulary.
inline std::optional<Kind> parse_kind(std::string_view name) {
    if (name == "compare")
        return Kind::Compare;
    if (name == "copy")
        return Kind::Clone;
    if (name == "equal" || name == "is_equal")
        return Kind::Equal;
    if (name == "free" || name == "destroy")
        return Kind::Destroy;
    if (name == "ref" || name == "ref_")
        return Kind::RefIncrement;
    if (name == "unref")
        return Kind::RefDecrement;
    if (name == "hash")
        return Kind::Hash;
    return std::nullopt;
}

/// Lowercase name of an operation kind, for logs.
inline const char* kind_name(Kind kind) {
    switch (kind) {
    case Kind::Compare:
        return "compare";
    case Kind::Clone:
        return "clone";
    case Kind::Equal:
        return "equal";
    case Kind::Destroy:
        return "destroy";
    case Kind::RefIncrement:
        return "ref";
    case Kind::RefDecrement:
        return "unref";
    case Kind::Format:
        return "format";
    case Kind::Hash:
        return "hash";
    }
    return "unknown";
}

/// Visibility of a function classified as `kind`.
inline Visibility visibility_for(Kind kind) {
    switch (kind) {
    case Kind::Clone:
    case Kind::Destroy:
    case Kind::RefIncrement:
    case Kind::RefDecrement:
        return Visibility::Hidden;
    case Kind::Hash:
    case Kind::Compare:
    case Kind::Equal:
        return Visibility::Private;
    case Kind::Format:
        return Visibility::Public;
    }
    return Visibility::Public;
}

/// The name that forces a deferred destroy decision.
constexpr std::string_view DESTROY_NAME = "destroy";

/// Reserved formatting name; renamed to `RENAMED_TO_STRING` on detection.
constexpr std::string_view TO_STRING_NAME = "to_string";
constexpr std::string_view RENAMED_TO_STRING = "to_str";

/// Stringify functions whose name makes them the type's formatting operation.
inline bool is_format_candidate(std::string_view name) {
    return name == "to_string" || name == "to_str" || name == "name" || name == "get_name";
}

// ============================================================================
// Registry
// ============================================================================

/// Special kinds of individual functions.
enum class FunctionKind {
    /// Stringify function returning a static string the caller must not free.
    StaticStringify
};

/// The function chosen for an operation kind.
struct TraitInfo {
    std::string symbol; ///< Exported C symbol of the source function
    std::optional<Version> version;
};

/// Extra metadata for one function, keyed by its C symbol.
struct FunctionInfo {
    FunctionKind kind;
    std::optional<Version> version;
};

using TraitInfos = std::map<Kind, TraitInfo>;
using FunctionInfos = std::map<std::string, FunctionInfo>;

/// Operations and per-function metadata detected for one type.
class Infos {
public:
    const TraitInfos& traits() const {
        return traits_;
    }

    TraitInfos& traits_mut() {
        return traits_;
    }

    bool has_trait(Kind kind) const {
        return traits_.count(kind) != 0;
    }

    const FunctionInfos& functions() const {
        return functions_;
    }

private:
    friend Infos extract(std::vector<Function>& functions, library::TypeKind type_kind,
                         const config::ObjectConfig& policy);

    TraitInfos traits_;
    FunctionInfos functions_;
};

// ============================================================================
// Passes
// ============================================================================

/// True if `func` takes only its instance and returns a non-null UTF-8
/// string. Renames `to_string` to `to_str` (permanently, even when the
/// function is then rejected) and, outside enumerations and bitfields and
/// unless the policy trusts the manifest, marks its return non-null.
bool is_stringify(Function& func, library::TypeKind type_kind, const config::ObjectConfig& policy);

/// Classifies `functions` in list order. A later function of the same kind
/// replaces an earlier one. Adjusts visibility of classified functions
/// unless they are Suppressed.
Infos extract(std::vector<Function>& functions, library::TypeKind type_kind,
              const config::ObjectConfig& policy);

/// Makes the source function of `kind` public, if `kind` was detected and
/// that function is not Suppressed.
void unhide(std::vector<Function>& functions, const Infos& specials, Kind kind);

/// Adds the declaration groups needed by the detected operations.
void analyze_imports(const Infos& specials, Imports& imports);

} // namespace wrapgen::analysis::specials

#endif // WRAPGEN_ANALYSIS_SPECIAL_FUNCTIONS_HPP
