#include <geohashing/fetch/http.hpp>

#include <curl/curl.h>
#include <fmt/format.h>

#include <memory>
#include <stdexcept>

namespace geohashing::fetch {

namespace {

struct CurlGlobal {
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("libcurl: global initialisation failed");
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    auto operator=(const CurlGlobal&) -> CurlGlobal& = delete;
};

struct CurlDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

auto append_body(char* data, std::size_t size, std::size_t count, void* user) -> std::size_t {
    auto* body = static_cast<std::string*>(user);
    body->append(data, size * count);
    return size * count;
}

}  // namespace

auto curl_get(const std::string& url, std::chrono::milliseconds timeout) -> HttpResponse {
    static const CurlGlobal global;

    CurlPtr handle{curl_easy_init()};
    if (!handle) {
        throw std::runtime_error("libcurl: curl_easy_init failed");
    }

    HttpResponse response;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &append_body);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode code = curl_easy_perform(handle.get());
    if (code == CURLE_OPERATION_TIMEDOUT) {
        response.outcome = HttpOutcome::TimedOut;
        response.error = curl_easy_strerror(code);
        return response;
    }
    if (code != CURLE_OK) {
        response.outcome = HttpOutcome::Failed;
        response.error = fmt::format("{} ({})", curl_easy_strerror(code), static_cast<int>(code));
        return response;
    }

    response.outcome = HttpOutcome::Response;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

}  // namespace geohashing::fetch
