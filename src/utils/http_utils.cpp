#include "http_utils.hpp"
#include <chrono>
#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <thread>

namespace GiftSniper {
namespace HttpUtils {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

namespace {

int transfer_progress_callback(void* client_pointer, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const AbortCheck* abort_check = static_cast<const AbortCheck*>(client_pointer);
    // Non-zero makes libcurl fail the transfer with CURLE_ABORTED_BY_CALLBACK
    return (*abort_check)(std::chrono::milliseconds(0)) ? 1 : 0;
}

// Returns true when the caller asked to abandon the request during the delay.
bool wait_before_retry(const HttpRequest& http_request) {
    std::chrono::milliseconds retry_delay(http_request.retry_delay_ms);
    if (http_request.abort_check) {
        return http_request.abort_check(retry_delay);
    }
    std::this_thread::sleep_for(retry_delay);
    return false;
}

} // anonymous namespace

HttpResponse http_post_json(const HttpRequest& http_request) {
    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) {
        throw std::runtime_error("Failed to initialize CURL for HTTP POST request");
    }

    HttpResponse http_response;
    struct curl_slist* headers = nullptr;

    try {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        headers = curl_slist_append(headers, "Accept: application/json");
        for (const std::string& header_line : http_request.headers) {
            headers = curl_slist_append(headers, header_line.c_str());
        }
        curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, http_request.body.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(http_request.body.size()));
        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &http_response.body);
        curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
        curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);
        if (http_request.abort_check) {
            curl_easy_setopt(curl_handle, CURLOPT_XFERINFOFUNCTION, transfer_progress_callback);
            curl_easy_setopt(curl_handle, CURLOPT_XFERINFODATA, &http_request.abort_check);
            curl_easy_setopt(curl_handle, CURLOPT_NOPROGRESS, 0L);
        }

        int attempt_count = http_request.retries > 0 ? http_request.retries : 1;
        CURLcode curl_result = CURLE_OK;
        bool success = false;

        for (int retry_attempt = 0; retry_attempt < attempt_count; ++retry_attempt) {
            http_response.body.clear();
            curl_result = curl_easy_perform(curl_handle);
            if (curl_result == CURLE_OK) {
                success = true;
                break;
            }
            if (curl_result == CURLE_ABORTED_BY_CALLBACK) {
                throw HttpAbortedError("HTTP POST abandoned during transfer. URL: " + http_request.url);
            }

            if (retry_attempt < attempt_count - 1 && wait_before_retry(http_request)) {
                throw HttpAbortedError("HTTP POST abandoned before retry " + std::to_string(retry_attempt + 2) +
                                       ". URL: " + http_request.url);
            }
        }

        if (!success) {
            std::string error_message = "HTTP POST failed after " + std::to_string(attempt_count) + " attempt(s). " +
                                       "Last error: " + std::string(curl_easy_strerror(curl_result)) +
                                       " URL: " + http_request.url;
            throw std::runtime_error(error_message);
        }

        curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_response.status_code);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl_handle);
        return http_response;
    } catch (...) {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl_handle);
        throw;
    }
}

void initialize_http_globals() {
    CURLcode init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init_result != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(init_result));
    }
}

void cleanup_http_globals() {
    curl_global_cleanup();
}

} // namespace HttpUtils
} // namespace GiftSniper
