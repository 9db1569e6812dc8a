#pragma once

#include <geohashing/core/coordinate.hpp>

#include <cstdint>
#include <string>

namespace geohashing::hash {

/// A finite coordinate value split at its first fractional digit, taken from
/// its shortest round-trip decimal form: `[-]whole.<tenths><rest>`.
struct DecimalParts {
    bool negative = false;
    std::uint64_t whole = 0;
    int tenths = 0;
    std::string rest;
};

[[nodiscard]] auto split_decimal(double value) -> DecimalParts;
[[nodiscard]] auto join_decimal(const DecimalParts& parts) -> double;

/// floor(|value| * 10) mod 10.
[[nodiscard]] auto tenths_digit(double value) -> int;

/// Replace the tenths digit of `dst` with that of `src`. Every other digit of
/// `dst` is kept.
[[nodiscard]] auto replace_tenths(double dst, double src) -> double;

/// Narrow a computed hash to the centicule (0.1 x 0.1 cell) of `original`.
[[nodiscard]] auto adjust_centicule(const Coordinate& computed, const Coordinate& original)
    -> Coordinate;

}  // namespace geohashing::hash
