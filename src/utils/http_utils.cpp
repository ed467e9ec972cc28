#include "http_utils.hpp"
#include <chrono>
#include <thread>
#include <curl/curl.h>
#include <string>
#include <stdexcept>

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string http_get(const HttpRequest& http_request, ConnectivityManager& connectivity_ref) {
    if (!connectivity_ref.should_attempt_connection()) {
        throw std::runtime_error("Quote feed backing off: " + connectivity_ref.describe_feed_state());
    }

    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) {
        throw std::runtime_error("Failed to initialize CURL for HTTP GET request");
    }

    std::string response;
    long http_response_code = 0;
    std::string last_error_message;
    bool success = false;

    try {
        curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
        curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);

        int attempt_count = http_request.retries > 0 ? http_request.retries : 1;
        for (int retry_attempt = 0; retry_attempt < attempt_count; ++retry_attempt) {
            response.clear();
            CURLcode curl_result = curl_easy_perform(curl_handle);
            curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_response_code);

            if (curl_result == CURLE_OK && http_response_code < 400) {
                success = true;
                break;
            }

            if (curl_result != CURLE_OK) {
                last_error_message = std::string(curl_easy_strerror(curl_result));
            } else {
                last_error_message = "server returned HTTP " + std::to_string(http_response_code);
            }
            connectivity_ref.report_failure("HTTP GET retry " + std::to_string(retry_attempt + 1) + "/" +
                                            std::to_string(attempt_count) + " failed: " + last_error_message);

            if (retry_attempt < attempt_count - 1 && http_request.rate_limit_delay_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(http_request.rate_limit_delay_ms));
            }
        }
    } catch (const std::exception&) {
        curl_easy_cleanup(curl_handle);
        throw;
    }
    curl_easy_cleanup(curl_handle);

    if (!success) {
        throw std::runtime_error("HTTP GET failed after " + std::to_string(http_request.retries) + " retries. " +
                                 "Last error: " + last_error_message + " (HTTP " + std::to_string(http_response_code) + ") " +
                                 "URL: " + http_request.url);
    }

    connectivity_ref.report_success();

    if (response.empty()) {
        throw std::runtime_error("HTTP GET succeeded but returned empty response (HTTP " +
                                 std::to_string(http_response_code) + ") for URL: " + http_request.url);
    }
    return response;
}
