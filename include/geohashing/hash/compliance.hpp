#pragma once

#include <geohashing/core/date.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace geohashing::hash {

/// 30W-rule classification.
enum class Compliance : std::uint8_t {
    Western,
    Eastern,
};

/// Longitudes strictly greater than this use the previous day's index value.
inline constexpr double kThirtyWest = -30.0;

/// Derive compliance from longitude unless an explicit override is given.
[[nodiscard]] constexpr auto resolve_compliance(double lon,
                                                std::optional<Compliance> override_with = {})
    -> Compliance {
    if (override_with) {
        return *override_with;
    }
    return lon > kThirtyWest ? Compliance::Eastern : Compliance::Western;
}

/// Date whose index value feeds the digest. Only the fetch key moves; the
/// hashed date string always stays the requested date.
[[nodiscard]] constexpr auto fetch_date(Date date, Compliance compliance) noexcept -> Date {
    return compliance == Compliance::Eastern ? add_days(date, -1) : date;
}

/// Parse "e", "east", "w" or "west" (any case).
[[nodiscard]] auto parse_compliance(std::string_view text) -> std::optional<Compliance>;

[[nodiscard]] auto to_string(Compliance compliance) -> const char*;

}  // namespace geohashing::hash
