#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace GiftSniper {
namespace HttpUtils {

// Waits up to the given duration and returns true when the request should be
// abandoned. Called with a zero duration while a transfer is in progress and
// with the retry delay between attempts.
using AbortCheck = std::function<bool(std::chrono::milliseconds wait_duration)>;

// Thrown instead of a transport error when the AbortCheck asked to stop.
class HttpAbortedError : public std::runtime_error {
public:
    explicit HttpAbortedError(const std::string& message) : std::runtime_error(message) {}
};

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;
    int retries;
    int timeout_seconds;
    bool enable_ssl_verification;
    int retry_delay_ms;
    AbortCheck abort_check;   // Empty: the request always runs to completion

    HttpRequest(const std::string& u,
                std::vector<std::string> h = std::vector<std::string>(),
                std::string b = "",
                int r = 1,
                int timeout = 30,
                bool ssl_verify = true,
                int retry_delay = 250)
        : url(u), headers(std::move(h)), body(std::move(b)), retries(r),
          timeout_seconds(timeout), enable_ssl_verification(ssl_verify), retry_delay_ms(retry_delay) {}
};

struct HttpResponse {
    long status_code = 0;
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s);

// POST a JSON body. Any HTTP status is returned to the caller; only transport
// failures (after all retries) throw std::runtime_error, and HttpAbortedError
// when the request's abort_check fires.
HttpResponse http_post_json(const HttpRequest& req);

// Process-wide libcurl setup and teardown, called once from main.
void initialize_http_globals();
void cleanup_http_globals();

} // namespace HttpUtils
} // namespace GiftSniper

#endif // HTTP_UTILS_HPP
