#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include "connectivity_manager.hpp"

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    int retries;
    int timeout_seconds;
    bool enable_ssl_verification;
    int rate_limit_delay_ms;

    explicit HttpRequest(const std::string& u,
                         int r = 1,
                         int timeout = 5,
                         bool ssl_verify = true,
                         int rate_delay = 100)
        : url(u), retries(r), timeout_seconds(timeout), enable_ssl_verification(ssl_verify),
          rate_limit_delay_ms(rate_delay) {}
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s);

// GET with retries. Throws std::runtime_error on transport failure, HTTP status >= 400,
// empty body, or while the connectivity manager is backing off.
std::string http_get(const HttpRequest& req, ConnectivityManager& connectivity_ref);

#endif // HTTP_UTILS_HPP
