#include <geohashing/hash/compliance.hpp>

#include <catch2/catch_test_macros.hpp>

using geohashing::hash::Compliance;
using geohashing::hash::resolve_compliance;

TEST_CASE("Compliance is derived from longitude", "[hash][compliance]") {
    REQUIRE(resolve_compliance(0.0) == Compliance::Eastern);
    REQUIRE(resolve_compliance(151.2) == Compliance::Eastern);
    REQUIRE(resolve_compliance(-29.999) == Compliance::Eastern);
    REQUIRE(resolve_compliance(-30.0) == Compliance::Western);
    REQUIRE(resolve_compliance(-122.5) == Compliance::Western);
}

TEST_CASE("Explicit compliance overrides longitude", "[hash][compliance]") {
    REQUIRE(resolve_compliance(-122.5, Compliance::Eastern) == Compliance::Eastern);
    REQUIRE(resolve_compliance(10.0, Compliance::Western) == Compliance::Western);
    REQUIRE(resolve_compliance(-30.0, Compliance::Western) == Compliance::Western);
}

TEST_CASE("Eastern compliance fetches the previous day", "[hash][compliance]") {
    auto date = geohashing::make_date(2008, 6, 1);
    REQUIRE(geohashing::hash::fetch_date(date, Compliance::Western) == date);
    REQUIRE(geohashing::format_iso(geohashing::hash::fetch_date(date, Compliance::Eastern)) ==
            "2008-05-31");
}

TEST_CASE("Compliance override text", "[hash][compliance]") {
    using geohashing::hash::parse_compliance;
    REQUIRE(parse_compliance("e") == Compliance::Eastern);
    REQUIRE(parse_compliance("EAST") == Compliance::Eastern);
    REQUIRE(parse_compliance("w") == Compliance::Western);
    REQUIRE(parse_compliance("West") == Compliance::Western);
    REQUIRE_FALSE(parse_compliance("north").has_value());
    REQUIRE_FALSE(parse_compliance("").has_value());
}
