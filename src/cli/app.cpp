#include <geohashing/cli/app.hpp>
#include <geohashing/cli/report.hpp>
#include <geohashing/hash/centicule.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

#include <ostream>

namespace geohashing::cli {

namespace {

auto fail(std::ostream& err, const Error& error) -> int {
    fmt::print(err, "geohash: {}\n", error.format());
    return 1;
}

}  // namespace

auto run(const Options& options, const engine::Environment& env, std::ostream& out,
         std::ostream& err) -> int {
    engine::HashRequest request;
    request.index_value = options.index_value;
    request.compliance = options.compliance;
    if (options.date) {
        auto date = parse_date(*options.date);
        if (!date) {
            return fail(err, date.error());
        }
        request.date = *date;
    }

    bool have_coordinate = options.latitude.has_value() && options.longitude.has_value();
    if (!have_coordinate && (!options.global || options.centicule)) {
        return fail(err, Error{.kind = ErrorKind::MissingCoordinate,
                               .message = options.global
                                              ? "--centicule needs a latitude and longitude"
                                              : "a latitude and longitude are required"});
    }

    auto result = options.global
                      ? engine::globalhash(request, env)
                      : engine::geohash(*options.latitude, *options.longitude, request, env);
    if (!result) {
        return fail(err, result.error());
    }
    spdlog::debug("hashed {} with index value {}", format_iso(result->date), result->index_value);

    auto location = result->location;
    if (options.centicule) {
        location = hash::adjust_centicule(
            location, Coordinate{.lat = *options.latitude, .lon = *options.longitude});
    }

    fmt::print(out, "{}", options.simple ? format_simple(location) : format_report(location));
    return 0;
}

}  // namespace geohashing::cli
