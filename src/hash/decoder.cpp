#include <geohashing/hash/decoder.hpp>

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace geohashing::hash {

namespace {

constexpr std::size_t kHalfLength = kDigestLength / 2;

}  // namespace

auto fractional_offset(std::string_view hex) -> double {
    if (hex.empty() || hex.size() > 16) {
        throw std::invalid_argument(fmt::format("fraction '{}' must have 1 to 16 hex digits", hex));
    }
    std::uint64_t mantissa = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), mantissa, 16);
    if (ec != std::errc() || ptr != hex.data() + hex.size()) {
        throw std::invalid_argument(fmt::format("fraction '{}' is not hexadecimal", hex));
    }
    // uint64 -> double rounds to nearest even; the power-of-two scale is exact.
    double value =
        std::ldexp(static_cast<double>(mantissa), -4 * static_cast<int>(hex.size()));
    return value < 1.0 ? value : 0.0;
}

auto fraction_text(double fraction) -> std::string {
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), fraction,
                                   std::chars_format::fixed);
    if (ec != std::errc()) {
        throw std::runtime_error(fmt::format("cannot render fraction {}", fraction));
    }
    std::string_view text(buffer.data(), static_cast<std::size_t>(ptr - buffer.data()));
    auto dot = text.find('.');
    if (dot == std::string_view::npos) {
        return {};
    }
    return std::string(text.substr(dot));
}

auto decode_axis(const GraticuleAxis& axis, double fraction) -> double {
    auto text = axis.text() + fraction_text(fraction);
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw std::runtime_error(fmt::format("cannot read back coordinate '{}'", text));
    }
    return value;
}

auto decode_location(const Graticule& graticule, std::string_view digest) -> Coordinate {
    if (digest.size() != kDigestLength) {
        throw std::invalid_argument(
            fmt::format("digest must be {} hex characters, got {}", kDigestLength, digest.size()));
    }
    return Coordinate{
        .lat = decode_axis(graticule.lat, fractional_offset(digest.substr(0, kHalfLength))),
        .lon = decode_axis(graticule.lon, fractional_offset(digest.substr(kHalfLength))),
    };
}

}  // namespace geohashing::hash
