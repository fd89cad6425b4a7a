//! # Library Version Implementation

#include "version/version.hpp"

#include <limits>

namespace wrapgen {

/// Parses one decimal component. Rejects empty, non-digit and out-of-range input.
static bool parse_component(std::string_view digits, uint16_t& out) {
    if (digits.empty())
        return false;

    uint32_t value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + static_cast<uint32_t>(c - '0');
        if (value > std::numeric_limits<uint16_t>::max())
            return false;
    }
    out = static_cast<uint16_t>(value);
    return true;
}

auto Version::parse(std::string_view text) -> Result<Version> {
    uint16_t parts[3] = {0, 0, 0};
    size_t count = 0;
    size_t pos = 0;

    while (true) {
        if (count == 3) {
            return "invalid version '" + std::string(text) + "': too many components";
        }
        size_t dot = text.find('.', pos);
        auto piece = text.substr(pos, dot == std::string_view::npos ? dot : dot - pos);
        if (!parse_component(piece, parts[count])) {
            return "invalid version '" + std::string(text) + "'";
        }
        ++count;
        if (dot == std::string_view::npos)
            break;
        pos = dot + 1;
    }

    return Version(parts[0], parts[1], parts[2]);
}

auto Version::to_string() const -> std::string {
    std::string result = std::to_string(major_) + "." + std::to_string(minor_);
    if (patch_ != 0) {
        result += "." + std::to_string(patch_);
    }
    return result;
}

auto Version::to_feature() const -> std::string {
    std::string result = "v" + std::to_string(major_) + "_" + std::to_string(minor_);
    if (patch_ != 0) {
        result += "_" + std::to_string(patch_);
    }
    return result;
}

} // namespace wrapgen
