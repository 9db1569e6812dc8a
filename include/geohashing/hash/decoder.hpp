#pragma once

#include <geohashing/core/coordinate.hpp>
#include <geohashing/hash/digest.hpp>

#include <string>
#include <string_view>

namespace geohashing::hash {

/// Value of the base-16 fraction `0.<hex>`, correctly rounded to double.
///
/// Always in [0, 1): a fraction that rounds up to 1.0 wraps to 0.
/// Throws std::invalid_argument if `hex` is empty, longer than 16 digits or
/// contains a non-hex character.
[[nodiscard]] auto fractional_offset(std::string_view hex) -> double;

/// Shortest round-trip decimal text of a fraction in [0, 1), without the
/// leading "0", e.g. ".8577132677070023". Zero renders as "".
[[nodiscard]] auto fraction_text(double fraction) -> std::string;

/// Splice a fraction behind a graticule degree and read it back as a double.
[[nodiscard]] auto decode_axis(const GraticuleAxis& axis, double fraction) -> double;

/// Map a digest into a graticule: the first half gives the latitude
/// fraction, the second half the longitude fraction.
[[nodiscard]] auto decode_location(const Graticule& graticule, std::string_view digest)
    -> Coordinate;

}  // namespace geohashing::hash
