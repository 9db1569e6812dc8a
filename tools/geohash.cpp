#include <geohashing/cli/app.hpp>
#include <geohashing/hash/compliance.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

auto main(int argc, char** argv) -> int {
    CLI::App app{"Calculate geohashes as defined by Randall Munroe in xkcd #426."};
    app.set_version_flag("--version", "geohash 0.1.0");

    double latitude = 0.0;
    double longitude = 0.0;
    std::string date;
    std::string index_value;
    std::string thirty_west;
    std::vector<std::string> sources;
    double timeout_seconds = 5.0;
    bool verbose = false;
    geohashing::cli::Options options;

    auto* lat_opt = app.add_option("latitude", latitude, "Latitude of a point in the graticule");
    auto* lon_opt = app.add_option("longitude", longitude, "Longitude of a point in the graticule");
    auto* date_opt = app.add_option("-d,--date", date,
                                    "The geohash date in YYYY-MM-DD format. The current date is "
                                    "used otherwise.");
    auto* index_opt = app.add_option("-j,--dow-jones,--dj", index_value,
                                     "The Dow Jones value, with two decimal places. The most "
                                     "recent compliant opening value is fetched otherwise.");
    auto* west_opt = app.add_option("--30w,--compliance", thirty_west,
                                    "Override automatic 30W detection, forcing either east or "
                                    "west.")
                         ->check(CLI::IsMember({"e", "w", "east", "west"}, CLI::ignore_case));
    app.add_flag("-g,--global", options.global,
                 "Calculate the globalhash instead. Lat and lon are ignored.");
    app.add_flag("-s,--simple", options.simple,
                 "Only return lat and lon, separated by a newline.");
    app.add_flag("--centicule", options.centicule, "Calculate the centicule instead.");
    app.add_option("--source", sources,
                   "Index source base URL, tried in the order given. Replaces the built-in "
                   "list.");
    app.add_option("--timeout", timeout_seconds, "Per-source timeout in seconds (default: 5)")
        ->check(CLI::Range(0.001, 3600.0));
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    if (lat_opt->count() > 0) {
        options.latitude = latitude;
    }
    if (lon_opt->count() > 0) {
        options.longitude = longitude;
    }
    if (date_opt->count() > 0) {
        options.date = date;
    }
    if (index_opt->count() > 0) {
        options.index_value = index_value;
    }
    if (west_opt->count() > 0) {
        options.compliance = geohashing::hash::parse_compliance(thirty_west);
    }

    geohashing::engine::Environment env;
    if (!sources.empty()) {
        env.fetch.sources = sources;
    }
    env.fetch.timeout = geohashing::fetch::timeout_from_seconds(timeout_seconds);

    try {
        return geohashing::cli::run(options, env, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "geohash: " << e.what() << "\n";
        return 1;
    }
}
