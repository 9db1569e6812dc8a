#pragma once

#include <cstdint>
#include <string>

namespace geohashing {

enum class ErrorKind : std::uint8_t {
    /// Every index source failed or had no value for the requested date.
    SourceUnavailable,
    /// A user-supplied date did not parse as `YYYY-MM-DD`.
    InvalidDateFormat,
    /// Graticule mode was requested without both latitude and longitude.
    MissingCoordinate,
};

struct Error {
    ErrorKind kind = ErrorKind::SourceUnavailable;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

[[nodiscard]] auto to_string(ErrorKind kind) -> const char*;

}  // namespace geohashing
