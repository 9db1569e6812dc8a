#pragma once

#include <geohashing/core/coordinate.hpp>
#include <geohashing/core/date.hpp>
#include <geohashing/core/error.hpp>
#include <geohashing/fetch/index_fetcher.hpp>
#include <geohashing/hash/compliance.hpp>
#include <geohashing/hash/digest.hpp>

#include <expected>
#include <optional>
#include <string>

namespace geohashing::engine {

/// Optional inputs of a hash. Unset fields fall back to today's date, the
/// fetched index value and the longitude-derived 30W compliance.
struct HashRequest {
    std::optional<Date> date;
    std::optional<std::string> index_value;
    std::optional<hash::Compliance> compliance;
};

/// A computed location together with the inputs that produced it.
struct HashResult {
    Coordinate location;
    Date date;
    std::string index_value;
    hash::Compliance compliance = hash::Compliance::Western;
    hash::Digest digest;
};

/// Everything the engines need to reach the index sources.
struct Environment {
    fetch::FetchConfig fetch;
    fetch::HttpGet get = fetch::curl_get;
};

/// Hash `request` into `graticule` under a fixed compliance.
[[nodiscard]] auto hash_graticule(const Graticule& graticule, hash::Compliance compliance,
                                  const HashRequest& request, const Environment& env)
    -> std::expected<HashResult, Error>;

/// xkcd #426 geohash for the graticule containing (lat, lon).
[[nodiscard]] auto geohash(double lat, double lon, const HashRequest& request,
                           const Environment& env) -> std::expected<HashResult, Error>;

/// Whole-globe hash. Any compliance in `request` is ignored; the global hash
/// is always eastern.
[[nodiscard]] auto globalhash(const HashRequest& request, const Environment& env)
    -> std::expected<HashResult, Error>;

/// Scale a fraction pair from the origin graticule to [-90, 90) x [-180, 180).
[[nodiscard]] constexpr auto rescale_global(const Coordinate& fraction) noexcept -> Coordinate {
    return Coordinate{.lat = fraction.lat * 180.0 - 90.0, .lon = fraction.lon * 360.0 - 180.0};
}

}  // namespace geohashing::engine
