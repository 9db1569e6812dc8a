#include <geohashing/hash/digest.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using geohashing::make_date;
using geohashing::hash::compute_digest;

TEST_CASE("Digest of the xkcd #426 example", "[hash][digest]") {
    auto date = make_date(2005, 5, 26);
    REQUIRE(geohashing::hash::digest_input(date, "10458.68") == "2005-05-26-10458.68");
    REQUIRE(compute_digest(date, "10458.68") == "db9318c2259923d08b672cb305440f97");
}

TEST_CASE("Digest is deterministic lowercase hex", "[hash][digest]") {
    auto date = make_date(2008, 5, 26);
    auto first = compute_digest(date, "12620.90");
    auto second = compute_digest(date, "12620.90");
    REQUIRE(first == second);
    REQUIRE(first.size() == geohashing::hash::kDigestLength);
    REQUIRE(std::ranges::all_of(
        first, [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }));
}

TEST_CASE("Digest hashes the index text verbatim", "[hash][digest]") {
    auto date = make_date(2005, 5, 26);
    REQUIRE(compute_digest(date, "10458.6") == "8f490d8a2ada73cf701224b5eb768db0");
    REQUIRE(compute_digest(date, "10458.60") == "c57a4707c2ac13652ee34569b91fb6d2");
}

TEST_CASE("md5 of empty input", "[hash][digest]") {
    REQUIRE(geohashing::hash::md5_hex("") == "d41d8cd98f00b204e9800998ecf8427e");
}
