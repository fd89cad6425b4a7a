//! # Special Functions Implementation
//!
//! Single ordered pass over a type's functions with a deferred decision for
//! functions literally named `destroy`: such a function becomes the Destroy
//! operation only if the type has a `copy` and no other destroying function.

#include "analysis/special_functions.hpp"

#include "log/log.hpp"

namespace wrapgen::analysis::specials {

// ============================================================================
// Stringify Detection
// ============================================================================

bool is_stringify(Function& func, library::TypeKind type_kind,
                  const config::ObjectConfig& policy) {
    if (func.parameters.size() != 1) {
        return false;
    }
    if (!func.parameters[0].instance_parameter) {
        return false;
    }
    if (!func.ret || func.ret->type != library::ValueType::Utf8) {
        return false;
    }

    if (func.name == TO_STRING_NAME) {
        // Keep clear of the target language's own owned-string conversion.
        func.name = std::string(RENAMED_TO_STRING);

        // Enumerations and bitfields are annotated correctly upstream; other
        // types historically treated to_string as never returning null.
        if (!policy.trust_return_value_nullability && !library::is_enumeration_like(type_kind)) {
            func.ret->nullable = false;
        }
    }

    // A nullable string cannot back a non-optional formatting operation.
    return !func.ret->nullable;
}

// ============================================================================
// Classification
// ============================================================================

namespace {

/// A `destroy` function waiting for the end of the pass.
struct DeferredDestroy {
    std::string symbol;
    size_t position;
};

void apply_visibility(Function& func, Kind kind) {
    if (func.visibility != Visibility::Suppressed) {
        func.visibility = visibility_for(kind);
    }
}

} // namespace

Infos extract(std::vector<Function>& functions, library::TypeKind type_kind,
              const config::ObjectConfig& policy) {
    Infos specials;
    bool has_clone = false;
    bool has_destroy = false;
    std::optional<DeferredDestroy> destroy;

    for (size_t pos = 0; pos < functions.size(); ++pos) {
        auto& func = functions[pos];

        // is_stringify may rename the function; every name check below must
        // run after it.
        if (is_stringify(func, type_kind, policy)) {
            bool returns_static_ref = func.ret->transfer == library::Transfer::None &&
                                      library::is_enumeration_like(type_kind) &&
                                      func.need_generate();

            if (returns_static_ref) {
                WRAPGEN_LOG_TRACE("analysis", func.symbol << " returns a static string");
                specials.functions_[func.symbol] =
                    FunctionInfo{FunctionKind::StaticStringify, func.version};
            }

            // With several candidates the last one wins.
            if (is_format_candidate(func.name)) {
                WRAPGEN_LOG_TRACE("analysis", "classified " << func.symbol << " as format");
                specials.traits_[Kind::Format] = TraitInfo{func.symbol, func.version};
            }
            continue;
        }

        auto kind = parse_kind(func.name);
        if (!kind) {
            continue;
        }

        if (func.name == DESTROY_NAME) {
            destroy = DeferredDestroy{func.symbol, pos};
            continue;
        }

        apply_visibility(func, *kind);
        if (*kind == Kind::Clone) {
            has_clone = true;
        } else if (*kind == Kind::Destroy) {
            has_destroy = true;
        }

        WRAPGEN_LOG_TRACE("analysis", "classified " << func.symbol << " as " << kind_name(*kind));
        specials.traits_[*kind] = TraitInfo{func.symbol, func.version};
    }

    if (has_clone && !has_destroy && destroy) {
        auto& func = functions[destroy->position];
        apply_visibility(func, Kind::Destroy);
        WRAPGEN_LOG_TRACE("analysis", "classified " << destroy->symbol << " as destroy");
        specials.traits_[Kind::Destroy] = TraitInfo{destroy->symbol, func.version};
    }

    WRAPGEN_LOG_DEBUG("analysis", "detected " << specials.traits_.size() << " operations and "
                                              << specials.functions_.size()
                                              << " special functions in "
                                              << library::type_kind_name(type_kind));
    return specials;
}

// ============================================================================
// Visibility Promotion
// ============================================================================

void unhide(std::vector<Function>& functions, const Infos& specials, Kind kind) {
    auto it = specials.traits().find(kind);
    if (it == specials.traits().end()) {
        return;
    }

    for (auto& func : functions) {
        if (func.symbol == it->second.symbol && func.visibility != Visibility::Suppressed) {
            func.visibility = Visibility::Public;
            return;
        }
    }
}

// ============================================================================
// Imports
// ============================================================================

void analyze_imports(const Infos& specials, Imports& imports) {
    for (const auto& [kind, info] : specials.traits()) {
        switch (kind) {
        case Kind::Compare:
            imports.add(ImportGroup::Ordering, info.version);
            break;
        case Kind::Format:
            imports.add(ImportGroup::Formatting, info.version);
            break;
        case Kind::Hash:
            imports.add(ImportGroup::Hashing, info.version);
            break;
        case Kind::Clone:
        case Kind::Equal:
        case Kind::Destroy:
        case Kind::RefIncrement:
        case Kind::RefDecrement:
            break;
        }
    }

    for (const auto& [_, info] : specials.functions()) {
        switch (info.kind) {
        case FunctionKind::StaticStringify:
            imports.add(ImportGroup::StaticString, info.version);
            break;
        }
    }
}

} // namespace wrapgen::analysis::specials
