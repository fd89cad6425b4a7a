//! # Library Version
//!
//! The version of the wrapped C library at which a function, type or
//! synthesized operation first becomes available. Emitters turn a version
//! into a conditional-compilation feature gate (`v2_56`).

#ifndef WRAPGEN_VERSION_HPP
#define WRAPGEN_VERSION_HPP

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace wrapgen {

/// A `major.minor.patch` library version. Missing components are zero.
class Version {
public:
    constexpr Version() = default;
    explicit constexpr Version(uint16_t maj, uint16_t min = 0, uint16_t pat = 0)
        : major_(maj), minor_(min), patch_(pat) {}

    /// Parses "M", "M.m" or "M.m.p". Returns an error message otherwise.
    static auto parse(std::string_view text) -> Result<Version>;

    uint16_t major_number() const {
        return major_;
    }
    uint16_t minor_number() const {
        return minor_;
    }
    uint16_t patch_number() const {
        return patch_;
    }

    /// "M.m", or "M.m.p" when the patch component is non-zero.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Feature name used for version gates: "vM_m" or "vM_m_p".
    [[nodiscard]] auto to_feature() const -> std::string;

    bool operator==(const Version& other) const = default;

    bool operator<(const Version& other) const {
        if (major_ != other.major_)
            return major_ < other.major_;
        if (minor_ != other.minor_)
            return minor_ < other.minor_;
        return patch_ < other.patch_;
    }
    bool operator>(const Version& other) const {
        return other < *this;
    }
    bool operator<=(const Version& other) const {
        return !(other < *this);
    }
    bool operator>=(const Version& other) const {
        return !(*this < other);
    }

private:
    uint16_t major_ = 0;
    uint16_t minor_ = 0;
    uint16_t patch_ = 0;
};

} // namespace wrapgen

#endif // WRAPGEN_VERSION_HPP
