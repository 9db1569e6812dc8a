#include <geohashing/cli/report.hpp>

#include <fmt/format.h>

#include <iterator>

namespace geohashing::cli {

auto format_degrees(double value) -> std::string {
    auto text = fmt::format("{}", value);
    if (text.find_first_of(".en") == std::string::npos) {
        text += ".0";
    }
    return text;
}

auto format_simple(const Coordinate& location) -> std::string {
    return fmt::format("{}\n{}\n", format_degrees(location.lat), format_degrees(location.lon));
}

auto google_maps_url(const Coordinate& location) -> std::string {
    return fmt::format("https://www.google.com/maps/search/?api=1&query={},{}",
                       format_degrees(location.lat), format_degrees(location.lon));
}

auto openstreetmap_url(const Coordinate& location) -> std::string {
    return fmt::format("https://www.openstreetmap.org/?mlat={}&mlon={}&zoom=10",
                       format_degrees(location.lat), format_degrees(location.lon));
}

auto format_report(const Coordinate& location) -> std::string {
    // Pad so the numbers line up whether or not they carry a minus sign.
    auto lat_pad = location.lat < 0 ? "  " : "   ";
    auto lon_pad = location.lon < 0 ? " " : "  ";
    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "Latitude:{}{}\n", lat_pad, format_degrees(location.lat));
    fmt::format_to(it, "Longitude:{}{}\n", lon_pad, format_degrees(location.lon));
    fmt::format_to(it, "\nGoogle Maps:\n\t{}\n", google_maps_url(location));
    fmt::format_to(it, "OpenStreetMap:\n\t{}\n", openstreetmap_url(location));
    return out;
}

}  // namespace geohashing::cli
