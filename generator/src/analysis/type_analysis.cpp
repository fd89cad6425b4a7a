//! # Type Analysis Implementation

#include "analysis/type_analysis.hpp"

#include "log/log.hpp"

namespace wrapgen::analysis {

auto analyze_type(std::vector<Function>& functions, library::TypeKind type_kind,
                  const config::ObjectConfig& policy, Imports& imports) -> specials::Infos {
    using specials::Kind;

    auto infos = specials::extract(functions, type_kind, policy);

    switch (type_kind) {
    case library::TypeKind::Record:
        // On a shared record `copy` duplicates while the wrapper's clone only
        // takes another reference, so both must be reachable.
        if (infos.has_trait(Kind::RefIncrement) && infos.has_trait(Kind::RefDecrement)) {
            specials::unhide(functions, infos, Kind::Clone);
        }
        break;
    case library::TypeKind::Class:
        specials::unhide(functions, infos, Kind::Clone);
        for (Kind kind : {Kind::Hash, Kind::Equal, Kind::Compare}) {
            specials::unhide(functions, infos, kind);
            infos.traits_mut().erase(kind);
        }
        break;
    case library::TypeKind::Enumeration:
    case library::TypeKind::Bitfield:
    case library::TypeKind::Other:
        break;
    }

    if (!policy.generate_display_trait && infos.traits_mut().erase(Kind::Format) != 0) {
        WRAPGEN_LOG_DEBUG("analysis", policy.name << ": formatting disabled by configuration");
    }

    specials::analyze_imports(infos, imports);
    return infos;
}

} // namespace wrapgen::analysis
