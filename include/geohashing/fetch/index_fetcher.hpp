#pragma once

#include <geohashing/core/date.hpp>
#include <geohashing/core/error.hpp>
#include <geohashing/fetch/http.hpp>

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace geohashing::fetch {

/// Mirrors serving the Dow Jones opening value as plain text at
/// `<base>YYYY/MM/DD`, in order of preference.
[[nodiscard]] auto default_sources() -> std::vector<std::string>;

inline constexpr std::chrono::milliseconds kDefaultTimeout{5000};
inline constexpr std::chrono::milliseconds kMinTimeout{1};
inline constexpr std::chrono::milliseconds kMaxTimeout{std::chrono::hours{1}};

/// Per-source timeout for a duration in seconds, clamped to
/// [kMinTimeout, kMaxTimeout]. NaN gives the default.
[[nodiscard]] auto timeout_from_seconds(double seconds) -> std::chrono::milliseconds;

struct FetchConfig {
    /// Tried strictly in order; each exactly once.
    std::vector<std::string> sources = default_sources();
    /// Bound on each single request.
    std::chrono::milliseconds timeout = kDefaultTimeout;
};

[[nodiscard]] auto source_url(std::string_view base, Date date) -> std::string;

/// Fetch the index value published for `date`.
///
/// `date` is the effective (already 30W-shifted) date. Sources are queried in
/// order; timeouts, transport failures and non-200 statuses move on to the
/// next one. The first 200 response wins and its whitespace-trimmed body is
/// returned verbatim. When none succeeds the error is SourceUnavailable.
[[nodiscard]] auto fetch_index(Date date, const FetchConfig& config, const HttpGet& get)
    -> std::expected<std::string, Error>;

}  // namespace geohashing::fetch
