#pragma once

#include <geohashing/core/error.hpp>

#include <compare>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace geohashing {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Build a date from its civil components. Components must form a valid date.
[[nodiscard]] auto make_date(int year, unsigned month, unsigned day) -> Date;

/// Parse a strict `YYYY-MM-DD` date.
[[nodiscard]] auto parse_date(std::string_view text) -> std::expected<Date, Error>;

/// `YYYY-MM-DD`, the form hashed into the digest.
[[nodiscard]] auto format_iso(Date date) -> std::string;

/// `YYYY/MM/DD`, the form appended to index source URLs.
[[nodiscard]] auto format_slashed(Date date) -> std::string;

[[nodiscard]] constexpr auto add_days(Date date, std::int32_t delta) noexcept -> Date {
    return Date{date.days + delta};
}

/// Current calendar date in the local time zone.
[[nodiscard]] auto today() -> Date;

}  // namespace geohashing

namespace std {

template <>
struct hash<geohashing::Date> {
    auto operator()(const geohashing::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

}  // namespace std
