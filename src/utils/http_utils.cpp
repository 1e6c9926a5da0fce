// HttpUtils.cpp
#include "http_utils.hpp"
#include "screener/screener_errors.hpp"
#include <chrono>
#include <thread>
#include <curl/curl.h>
#include <string>

using TightZone::Screener::DecodeError;
using TightZone::Screener::TransportError;

namespace {

bool is_success_status(long http_response_code) {
    return http_response_code >= 200 && http_response_code < 300;
}

std::string perform_request(const HttpRequest& http_request, const std::string& method_name) {
    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) {
        throw TransportError("Failed to initialize CURL for HTTP " + method_name + " request");
    }

    std::string response;
    long http_response_code = 0;
    struct curl_slist* headers = nullptr;

    try {
        for (const auto& header_line : http_request.headers) {
            headers = curl_slist_append(headers, header_line.c_str());
        }
        if (method_name == "POST") {
            headers = curl_slist_append(headers, "Content-Type: application/json");
            curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, http_request.body.c_str());
            curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(http_request.body.size()));
        }
        curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
        if (!http_request.user_agent.empty()) {
            curl_easy_setopt(curl_handle, CURLOPT_USERAGENT, http_request.user_agent.c_str());
        }
        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
        curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);

        // Rate limiting
        if (http_request.rate_limit_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(http_request.rate_limit_delay_ms));
        }

        int attempt_count = http_request.retries < 1 ? 1 : http_request.retries;
        CURLcode curl_result = CURLE_OK;
        bool success = false;

        for (int retry_attempt = 0; retry_attempt < attempt_count; ++retry_attempt) {
            response.clear();
            curl_result = curl_easy_perform(curl_handle);
            if (curl_result == CURLE_OK) {
                success = true;
                break;
            }
            if (retry_attempt < attempt_count - 1) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }

        if (!success) {
            throw TransportError("HTTP " + method_name + " failed after " + std::to_string(attempt_count) + " attempt(s): " +
                                 std::string(curl_easy_strerror(curl_result)) + " URL: " + http_request.url);
        }

        curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_response_code);
        if (!is_success_status(http_response_code)) {
            throw TransportError("HTTP " + method_name + " returned status " + std::to_string(http_response_code) +
                                 " URL: " + http_request.url);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl_handle);
        return response;
    } catch (...) {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl_handle);
        throw;
    }
}

} // namespace

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string http_get(const HttpRequest& http_request) {
    return perform_request(http_request, "GET");
}

std::string http_post(const HttpRequest& http_request) {
    return perform_request(http_request, "POST");
}

std::string url_escape(const std::string& raw_value) {
    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) {
        throw TransportError("Failed to initialize CURL for URL escaping");
    }
    char* escaped_pointer = curl_easy_escape(curl_handle, raw_value.c_str(), static_cast<int>(raw_value.size()));
    if (!escaped_pointer) {
        curl_easy_cleanup(curl_handle);
        throw TransportError("Failed to URL-escape '" + raw_value + "'");
    }
    std::string escaped_value(escaped_pointer);
    curl_free(escaped_pointer);
    curl_easy_cleanup(curl_handle);
    return escaped_value;
}

nlohmann::json parse_json_body(const std::string& body, const std::string& source_description) {
    if (body.empty()) {
        throw DecodeError(source_description + " returned an empty body");
    }
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& parse_exception_error) {
        throw DecodeError(source_description + " returned invalid JSON: " + parse_exception_error.what());
    }
}
