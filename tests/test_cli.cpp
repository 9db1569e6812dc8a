#include <geohashing/cli/app.hpp>
#include <geohashing/cli/report.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <sstream>
#include <string>

using geohashing::Coordinate;
using geohashing::cli::Options;
using geohashing::engine::Environment;
using geohashing::fetch::HttpOutcome;
using geohashing::fetch::HttpResponse;

namespace {

auto offline() -> Environment {
    Environment env;
    env.fetch.sources = {"http://a.test/"};
    env.get = [](const std::string&, std::chrono::milliseconds) {
        return HttpResponse{.outcome = HttpOutcome::TimedOut};
    };
    return env;
}

struct Run {
    int code = 0;
    std::string out;
    std::string err;
};

auto run(const Options& options) -> Run {
    std::ostringstream out;
    std::ostringstream err;
    int code = geohashing::cli::run(options, offline(), out, err);
    return Run{.code = code, .out = out.str(), .err = err.str()};
}

auto example() -> Options {
    Options options;
    options.latitude = 37.421542;
    options.longitude = -122.085589;
    options.date = "2005-05-26";
    options.index_value = "10458.68";
    return options;
}

}  // namespace

TEST_CASE("Simple output prints two lines", "[cli]") {
    auto options = example();
    options.simple = true;
    auto result = run(options);
    REQUIRE(result.code == 0);
    REQUIRE(result.out == "37.857713267707005\n-122.54454306955928\n");
    REQUIRE(result.err.empty());
}

TEST_CASE("Report output aligns coordinates and links maps", "[cli]") {
    auto result = run(example());
    REQUIRE(result.code == 0);
    REQUIRE(result.out ==
            "Latitude:   37.857713267707005\n"
            "Longitude: -122.54454306955928\n"
            "\n"
            "Google Maps:\n"
            "\thttps://www.google.com/maps/search/?api=1&query=37.857713267707005,"
            "-122.54454306955928\n"
            "OpenStreetMap:\n"
            "\thttps://www.openstreetmap.org/?mlat=37.857713267707005&mlon=-122.54454306955928"
            "&zoom=10\n");
}

TEST_CASE("Malformed date exits with 1", "[cli]") {
    auto options = example();
    options.date = "26/05/2005";
    auto result = run(options);
    REQUIRE(result.code == 1);
    REQUIRE(result.out.empty());
    REQUIRE(result.err.find("YYYY-MM-DD") != std::string::npos);
}

TEST_CASE("Graticule mode needs both coordinates", "[cli]") {
    auto options = example();
    options.longitude.reset();
    auto result = run(options);
    REQUIRE(result.code == 1);
    REQUIRE(result.err.find("missing coordinate") != std::string::npos);
}

TEST_CASE("Global mode runs without coordinates", "[cli]") {
    Options options;
    options.global = true;
    options.simple = true;
    options.date = "2008-05-26";
    options.index_value = "12620.90";
    auto result = run(options);
    REQUIRE(result.code == 0);
    REQUIRE(result.out == "31.163058777367056\n38.63088243733188\n");
}

TEST_CASE("Global centicule still needs coordinates", "[cli]") {
    Options options;
    options.global = true;
    options.centicule = true;
    options.date = "2008-05-26";
    options.index_value = "12620.90";
    REQUIRE(run(options).code == 1);
}

TEST_CASE("Centicule replaces the tenths digits", "[cli]") {
    auto options = example();
    options.simple = true;
    options.centicule = true;
    auto result = run(options);
    REQUIRE(result.code == 0);
    REQUIRE(result.out == "37.45771326770701\n-122.04454306955928\n");
}

TEST_CASE("Unreachable sources exit with 1 and ask for a manual value", "[cli]") {
    auto options = example();
    options.index_value.reset();
    auto result = run(options);
    REQUIRE(result.code == 1);
    REQUIRE(result.err.find("manually") != std::string::npos);
}

TEST_CASE("Report pads positive longitudes", "[cli][report]") {
    auto text = geohashing::cli::format_report(Coordinate{.lat = -33.5, .lon = 151.25});
    REQUIRE(text.starts_with("Latitude:  -33.5\nLongitude:  151.25\n"));
    REQUIRE(geohashing::cli::openstreetmap_url(Coordinate{.lat = -33.5, .lon = 151.25}) ==
            "https://www.openstreetmap.org/?mlat=-33.5&mlon=151.25&zoom=10");
}

TEST_CASE("Whole-degree coordinates keep a decimal point", "[cli][report]") {
    using geohashing::cli::format_degrees;
    REQUIRE(format_degrees(37.0) == "37.0");
    REQUIRE(format_degrees(-122.0) == "-122.0");
    REQUIRE(format_degrees(0.0) == "0.0");
    REQUIRE(format_degrees(37.5) == "37.5");
    REQUIRE(geohashing::cli::format_simple(Coordinate{.lat = 37.0, .lon = -122.0}) ==
            "37.0\n-122.0\n");
}
