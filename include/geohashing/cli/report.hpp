#pragma once

#include <geohashing/core/coordinate.hpp>

#include <string>

namespace geohashing::cli {

/// Shortest text that reads back as the same double; whole numbers keep ".0".
[[nodiscard]] auto format_degrees(double value) -> std::string;

/// Latitude and longitude on two lines.
[[nodiscard]] auto format_simple(const Coordinate& location) -> std::string;

[[nodiscard]] auto google_maps_url(const Coordinate& location) -> std::string;
[[nodiscard]] auto openstreetmap_url(const Coordinate& location) -> std::string;

/// Aligned coordinates followed by map links.
[[nodiscard]] auto format_report(const Coordinate& location) -> std::string;

}  // namespace geohashing::cli
