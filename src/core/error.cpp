#include <geohashing/core/error.hpp>

#include <fmt/format.h>

namespace geohashing {

auto to_string(ErrorKind kind) -> const char* {
    switch (kind) {
        case ErrorKind::SourceUnavailable:
            return "source unavailable";
        case ErrorKind::InvalidDateFormat:
            return "invalid date format";
        case ErrorKind::MissingCoordinate:
            return "missing coordinate";
    }
    return "unknown error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace geohashing
