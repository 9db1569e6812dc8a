#include <geohashing/engine/engine.hpp>

#include <geohashing/hash/decoder.hpp>

#include <spdlog/spdlog.h>

namespace geohashing::engine {

auto hash_graticule(const Graticule& graticule, hash::Compliance compliance,
                    const HashRequest& request, const Environment& env)
    -> std::expected<HashResult, Error> {
    HashResult result;
    result.date = request.date.value_or(today());
    result.compliance = compliance;

    if (request.index_value) {
        result.index_value = *request.index_value;
    } else {
        auto effective = hash::fetch_date(result.date, compliance);
        spdlog::debug("compliance {}: using index value of {}", hash::to_string(compliance),
                      format_iso(effective));
        auto fetched = fetch::fetch_index(effective, env.fetch, env.get);
        if (!fetched) {
            return std::unexpected(fetched.error());
        }
        result.index_value = std::move(*fetched);
    }

    result.digest = hash::compute_digest(result.date, result.index_value);
    spdlog::debug("digest of '{}' is {}", hash::digest_input(result.date, result.index_value),
                  result.digest);
    result.location = hash::decode_location(graticule, result.digest);
    return result;
}

auto geohash(double lat, double lon, const HashRequest& request, const Environment& env)
    -> std::expected<HashResult, Error> {
    auto compliance = hash::resolve_compliance(lon, request.compliance);
    return hash_graticule(Graticule::from_coordinate(lat, lon), compliance, request, env);
}

auto globalhash(const HashRequest& request, const Environment& env)
    -> std::expected<HashResult, Error> {
    auto result = hash_graticule(Graticule{}, hash::Compliance::Eastern, request, env);
    if (result) {
        result->location = rescale_global(result->location);
    }
    return result;
}

}  // namespace geohashing::engine
