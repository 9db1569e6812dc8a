#include <geohashing/fetch/index_fetcher.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>

namespace geohashing::fetch {

namespace {

constexpr long kHttpOk = 200;

auto trim(std::string_view input) -> std::string_view {
    auto start = input.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = input.find_last_not_of(" \t\n\r\f\v");
    return input.substr(start, end - start + 1);
}

}  // namespace

auto default_sources() -> std::vector<std::string> {
    return {
        "http://geo.crox.net/djia/",
        "http://www1.geo.crox.net/djia/",
        "http://www2.geo.crox.net/djia/",
        "http://carabiner.peeron.com/xkcd/map/data/",
    };
}

auto timeout_from_seconds(double seconds) -> std::chrono::milliseconds {
    if (std::isnan(seconds)) {
        return kDefaultTimeout;
    }
    double millis = seconds * 1000.0;
    if (millis <= static_cast<double>(kMinTimeout.count())) {
        return kMinTimeout;
    }
    if (millis >= static_cast<double>(kMaxTimeout.count())) {
        return kMaxTimeout;
    }
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(millis)};
}

auto source_url(std::string_view base, Date date) -> std::string {
    return fmt::format("{}{}", base, format_slashed(date));
}

auto fetch_index(Date date, const FetchConfig& config, const HttpGet& get)
    -> std::expected<std::string, Error> {
    for (const auto& base : config.sources) {
        auto url = source_url(base, date);
        spdlog::debug("fetching index value: {}", url);
        auto response = get(url, config.timeout);
        switch (response.outcome) {
            case HttpOutcome::TimedOut:
                spdlog::debug("{} timed out after {} ms", url, config.timeout.count());
                continue;
            case HttpOutcome::Failed:
                spdlog::debug("{} failed: {}", url, response.error);
                continue;
            case HttpOutcome::Response:
                break;
        }
        if (response.status != kHttpOk) {
            spdlog::debug("{} answered HTTP {}", url, response.status);
            continue;
        }
        auto value = std::string(trim(response.body));
        spdlog::debug("index value for {} is '{}'", format_iso(date), value);
        return value;
    }

    spdlog::warn("no index source answered for {}", format_iso(date));
    return std::unexpected(Error{
        .kind = ErrorKind::SourceUnavailable,
        .message = fmt::format("none of the {} Dow Jones sources is online, or no data exists "
                               "for {} yet. Try providing the value manually.",
                               config.sources.size(), format_iso(date)),
    });
}

}  // namespace geohashing::fetch
