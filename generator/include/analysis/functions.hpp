//! # Function Descriptors
//!
//! Analyzed view of one exported C function, as produced by the upstream
//! function analysis and consumed (and mutated) by the special-function
//! classifier and the emitter.

#ifndef WRAPGEN_ANALYSIS_FUNCTIONS_HPP
#define WRAPGEN_ANALYSIS_FUNCTIONS_HPP

#include "library/library.hpp"
#include "version/version.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wrapgen::analysis {

/// How a function is exposed in the generated wrapper.
enum class Visibility {
    Public,    ///< Directly callable by users of the wrapper
    Private,   ///< Only used by the wrapper's own operation implementations
    Hidden,    ///< Replaced by a synthesized high-level operation
    Suppressed ///< Emitted as a comment only; never touched by analysis passes
};

/// Whether the emitter produces code for a function at all.
enum class GenerationStatus {
    Generate, ///< Generated automatically
    Manual,   ///< Bound by hand-written code
    Ignore    ///< Not bound
};

/// One C-level parameter.
struct Parameter {
    std::string name;
    library::ValueType type = library::ValueType::None;
    bool instance_parameter = false; ///< The implicit `self` argument
};

/// Return value of a function that returns something.
struct ReturnValue {
    library::ValueType type = library::ValueType::None;
    bool nullable = false;
    library::Transfer transfer = library::Transfer::None;
};

/// An analyzed function of a library type.
struct Function {
    std::string name;   ///< Method name within its type (e.g. "copy"); may be renamed
    std::string symbol; ///< Exported C symbol (e.g. "gdk_rgba_copy")
    std::vector<Parameter> parameters;
    std::optional<ReturnValue> ret;
    Visibility visibility = Visibility::Public;
    std::optional<Version> version; ///< Minimum library version
    GenerationStatus status = GenerationStatus::Generate;

    [[nodiscard]] bool need_generate() const {
        return status == GenerationStatus::Generate;
    }
};

} // namespace wrapgen::analysis

#endif // WRAPGEN_ANALYSIS_FUNCTIONS_HPP
