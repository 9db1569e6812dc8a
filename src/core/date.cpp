#include <geohashing/core/date.hpp>

#include <fmt/format.h>

#include <chrono>
#include <charconv>
#include <ctime>
#include <limits>
#include <optional>
#include <stdexcept>

namespace geohashing {

namespace {

auto to_civil(Date date) -> std::chrono::year_month_day {
    using namespace std::chrono;
    return year_month_day{sys_days{days{date.days}}};
}

auto format_with(Date date, char sep) -> std::string {
    auto ymd = to_civil(date);
    return fmt::format("{:04}{}{:02}{}{:02}", static_cast<int>(ymd.year()), sep,
                       static_cast<unsigned>(ymd.month()), sep, static_cast<unsigned>(ymd.day()));
}

auto invalid_date(std::string_view text) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::InvalidDateFormat,
                                 .message = fmt::format(
                                     "'{}' is not a date in YYYY-MM-DD format", text)});
}

}  // namespace

auto make_date(int year, unsigned month, unsigned day) -> Date {
    using namespace std::chrono;
    sys_days since = sys_days{year_month_day{std::chrono::year{year}, std::chrono::month{month},
                                             std::chrono::day{day}}};
    return Date{static_cast<std::int32_t>(since.time_since_epoch().count())};
}

auto parse_date(std::string_view text) -> std::expected<Date, Error> {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return invalid_date(text);
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i != 4 && i != 7 && (text[i] < '0' || text[i] > '9')) {
            return invalid_date(text);
        }
    }
    auto parse_int = [](std::string_view part) -> std::optional<int> {
        int value = 0;
        auto result = std::from_chars(part.data(), part.data() + part.size(), value);
        if (result.ec != std::errc()) {
            return std::nullopt;
        }
        return value;
    };
    auto year = parse_int(text.substr(0, 4));
    auto month = parse_int(text.substr(5, 2));
    auto day = parse_int(text.substr(8, 2));
    if (!year || !month || !day) {
        return invalid_date(text);
    }
    using namespace std::chrono;
    year_month_day ymd{std::chrono::year{*year}, std::chrono::month{static_cast<unsigned>(*month)},
                       std::chrono::day{static_cast<unsigned>(*day)}};
    if (!ymd.ok()) {
        return invalid_date(text);
    }
    auto days_since = sys_days{ymd}.time_since_epoch().count();
    if (days_since < std::numeric_limits<std::int32_t>::min() ||
        days_since > std::numeric_limits<std::int32_t>::max()) {
        return invalid_date(text);
    }
    return Date{static_cast<std::int32_t>(days_since)};
}

auto format_iso(Date date) -> std::string {
    return format_with(date, '-');
}

auto format_slashed(Date date) -> std::string {
    return format_with(date, '/');
}

auto today() -> Date {
    tzset();
    std::time_t now = std::time(nullptr);
    std::tm local{};
    if (localtime_r(&now, &local) == nullptr) {
        throw std::runtime_error("cannot convert the current time to a local date");
    }
    return make_date(local.tm_year + 1900, static_cast<unsigned>(local.tm_mon + 1),
                     static_cast<unsigned>(local.tm_mday));
}

}  // namespace geohashing
