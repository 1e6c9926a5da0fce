#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;  // "Name: value"
    std::string user_agent;
    int retries;
    int timeout_seconds;
    bool enable_ssl_verification;
    int rate_limit_delay_ms;
    std::string body; // for POST; leave empty for GET

    HttpRequest(const std::string& u,
                int r = 1,
                int timeout = 30,
                bool ssl_verify = true,
                int rate_delay = 0,
                std::string b = "")
        : url(u), headers(), user_agent(), retries(r), timeout_seconds(timeout),
          enable_ssl_verification(ssl_verify), rate_limit_delay_ms(rate_delay), body(std::move(b)) {}
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s);

// Both throw TightZone::Screener::TransportError on network failure or a non-2xx status.
std::string http_get(const HttpRequest& req);

std::string http_post(const HttpRequest& req);

// Percent-encodes a single path or query component.
std::string url_escape(const std::string& raw_value);

// Throws TightZone::Screener::DecodeError when the body is empty or not JSON.
nlohmann::json parse_json_body(const std::string& body, const std::string& source_description);

#endif // HTTP_UTILS_HPP
