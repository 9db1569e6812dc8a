#include <geohashing/geohashing.hpp>

#include <fmt/core.h>

auto main() -> int {
    // The worked example from xkcd #426: Palo Alto, 2005-05-26, Dow opening 10458.68
    auto date = geohashing::make_date(2005, 5, 26);

    fmt::print("=== Digest ===\n");
    auto digest = geohashing::hash::compute_digest(date, "10458.68");
    fmt::print("md5(\"{}\") = {}\n", geohashing::hash::digest_input(date, "10458.68"), digest);

    fmt::print("\n=== Decoding ===\n");
    auto graticule = geohashing::Graticule::from_coordinate(37.421542, -122.085589);
    fmt::print("graticule: {} {}\n", graticule.lat.text(), graticule.lon.text());
    fmt::print("fractions: {} {}\n", geohashing::hash::fractional_offset(digest.substr(0, 16)),
               geohashing::hash::fractional_offset(digest.substr(16)));

    auto location = geohashing::hash::decode_location(graticule, digest);
    fmt::print("geohash: {}, {}\n", location.lat, location.lon);

    auto centicule = geohashing::hash::adjust_centicule(
        location, geohashing::Coordinate{.lat = 37.421542, .lon = -122.085589});
    fmt::print("centicule: {}, {}\n", centicule.lat, centicule.lon);

    // Same inputs through the engine; the value is supplied, so nothing is fetched
    fmt::print("\n=== Engine ===\n");
    geohashing::engine::Environment env;
    auto result = geohashing::engine::globalhash(
        geohashing::engine::HashRequest{.date = date, .index_value = "10458.68"}, env);
    if (!result) {
        fmt::print("globalhash failed: {}\n", result.error().format());
        return 1;
    }
    fmt::print("globalhash: {}, {}\n", result->location.lat, result->location.lon);

    return 0;
}
