#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace geohashing::fetch {

enum class HttpOutcome : std::uint8_t {
    /// A response arrived; inspect `status`.
    Response,
    /// The request did not finish within its timeout.
    TimedOut,
    /// Transport failure: DNS, connection refused, TLS, ...
    Failed,
};

struct HttpResponse {
    HttpOutcome outcome = HttpOutcome::Failed;
    long status = 0;
    std::string body;
    /// Transport error description when outcome != Response.
    std::string error;
};

/// Blocking GET bounded by `timeout`. Implementations must not throw for
/// network conditions; they report them through HttpResponse.
using HttpGet =
    std::function<HttpResponse(const std::string& url, std::chrono::milliseconds timeout)>;

/// libcurl-backed HttpGet.
[[nodiscard]] auto curl_get(const std::string& url, std::chrono::milliseconds timeout)
    -> HttpResponse;

}  // namespace geohashing::fetch
