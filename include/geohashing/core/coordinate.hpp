#pragma once

#include <cstdint>
#include <string>

namespace geohashing {

struct Coordinate {
    double lat = 0.0;
    double lon = 0.0;
};

/// One graticule axis: the integer degree of a coordinate truncated toward zero.
/// Inputs in (-1, 0) and [0, 1) share degree 0.
struct GraticuleAxis {
    std::int32_t degree = 0;

    [[nodiscard]] static auto from_coordinate(double value) -> GraticuleAxis;

    /// Integer part as written in front of the decimal fraction, e.g. "37", "-122", "0".
    [[nodiscard]] auto text() const -> std::string;

    auto operator==(const GraticuleAxis&) const -> bool = default;
};

/// A 1x1 degree cell identified by truncated latitude and longitude.
struct Graticule {
    GraticuleAxis lat;
    GraticuleAxis lon;

    [[nodiscard]] static auto from_coordinate(double lat, double lon) -> Graticule {
        return Graticule{GraticuleAxis::from_coordinate(lat), GraticuleAxis::from_coordinate(lon)};
    }

    auto operator==(const Graticule&) const -> bool = default;
};

}  // namespace geohashing
