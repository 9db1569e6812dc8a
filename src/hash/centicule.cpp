#include <geohashing/hash/centicule.hpp>

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <string_view>

namespace geohashing::hash {

namespace {

// Above this the whole part no longer fits the digit split.
constexpr double kMaxMagnitude = 1e18;

}  // namespace

auto split_decimal(double value) -> DecimalParts {
    if (!std::isfinite(value) || std::abs(value) >= kMaxMagnitude) {
        throw std::invalid_argument(fmt::format("cannot split {} into decimal digits", value));
    }
    DecimalParts parts;
    parts.negative = std::signbit(value);

    std::array<char, 400> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), std::abs(value),
                                   std::chars_format::fixed);
    if (ec != std::errc()) {
        throw std::runtime_error(fmt::format("cannot render {}", value));
    }
    std::string_view text(buffer.data(), static_cast<std::size_t>(ptr - buffer.data()));

    auto dot = text.find('.');
    auto whole = text.substr(0, dot);
    auto parsed = std::from_chars(whole.data(), whole.data() + whole.size(), parts.whole);
    if (parsed.ec != std::errc()) {
        throw std::runtime_error(fmt::format("cannot read whole part of {}", value));
    }
    if (dot != std::string_view::npos && dot + 1 < text.size()) {
        parts.tenths = text[dot + 1] - '0';
        parts.rest = std::string(text.substr(dot + 2));
    }
    return parts;
}

auto join_decimal(const DecimalParts& parts) -> double {
    auto text = fmt::format("{}{}.{}{}", parts.negative ? "-" : "", parts.whole, parts.tenths,
                            parts.rest);
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw std::runtime_error(fmt::format("cannot read back '{}'", text));
    }
    return value;
}

auto tenths_digit(double value) -> int {
    if (!std::isfinite(value)) {
        return 0;
    }
    return static_cast<int>(std::fmod(std::floor(std::abs(value) * 10.0), 10.0));
}

auto replace_tenths(double dst, double src) -> double {
    auto parts = split_decimal(dst);
    parts.tenths = tenths_digit(src);
    return join_decimal(parts);
}

auto adjust_centicule(const Coordinate& computed, const Coordinate& original) -> Coordinate {
    return Coordinate{.lat = replace_tenths(computed.lat, original.lat),
                      .lon = replace_tenths(computed.lon, original.lon)};
}

}  // namespace geohashing::hash
