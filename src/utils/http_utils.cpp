#include "http_utils.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include <curl/curl.h>

namespace CanslimScanner {
namespace API {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string replace_url_placeholder(const std::string& request_url, const std::string& symbol) {
    std::string result_url = request_url;
    const std::string placeholder = "{symbol}";
    size_t placeholder_position = result_url.find(placeholder);
    while (placeholder_position != std::string::npos) {
        result_url.replace(placeholder_position, placeholder.size(), symbol);
        placeholder_position = result_url.find(placeholder, placeholder_position + symbol.size());
    }
    return result_url;
}

bool is_retryable_http_status(long http_response_code) {
    return http_response_code == 429 || http_response_code == 500 || http_response_code == 502 ||
           http_response_code == 503 || http_response_code == 504;
}

CurlGlobalInitializer::CurlGlobalInitializer() {
    CURLcode init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init_result != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed: " + std::string(curl_easy_strerror(init_result)));
    }
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}

namespace {
    struct CurlHandleDeleter {
        void operator()(CURL* curl_handle) const { curl_easy_cleanup(curl_handle); }
    };
    struct CurlHeaderListDeleter {
        void operator()(curl_slist* header_list) const { curl_slist_free_all(header_list); }
    };
    using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
    using CurlHeaderList = std::unique_ptr<curl_slist, CurlHeaderListDeleter>;

    CurlHeaderList build_header_list(const std::vector<std::string>& header_lines) {
        curl_slist* header_list = nullptr;
        for (const std::string& header_line : header_lines) {
            curl_slist* extended_list = curl_slist_append(header_list, header_line.c_str());
            if (!extended_list) {
                curl_slist_free_all(header_list);
                throw std::runtime_error("Failed to build HTTP header list");
            }
            header_list = extended_list;
        }
        return CurlHeaderList(header_list);
    }
}

std::string CurlHttpClient::get(const HttpRequest& http_request) const {
    CurlHandle curl_handle(curl_easy_init());
    if (!curl_handle) {
        throw std::runtime_error("Failed to initialize CURL for " + http_request.url);
    }
    CurlHeaderList header_list = build_header_list(http_request.headers);

    std::string response_body;
    curl_easy_setopt(curl_handle.get(), CURLOPT_URL, http_request.url.c_str());
    curl_easy_setopt(curl_handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_handle.get(), CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
    curl_easy_setopt(curl_handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);
    if (!http_request.user_agent.empty()) {
        curl_easy_setopt(curl_handle.get(), CURLOPT_USERAGENT, http_request.user_agent.c_str());
    }

    const int attempt_count = std::max(1, http_request.retries);
    long http_status = 0;
    std::string last_failure;
    for (int attempt = 1; attempt <= attempt_count; ++attempt) {
        response_body.clear();
        http_status = 0;
        CURLcode transfer_result = curl_easy_perform(curl_handle.get());
        curl_easy_getinfo(curl_handle.get(), CURLINFO_RESPONSE_CODE, &http_status);

        if (transfer_result == CURLE_OK && http_status < 400) {
            if (response_body.empty()) {
                throw std::runtime_error("Empty response (HTTP " + std::to_string(http_status) + ") from " + http_request.url);
            }
            return response_body;
        }

        if (transfer_result != CURLE_OK) {
            last_failure = curl_easy_strerror(transfer_result);
        } else {
            last_failure = "HTTP " + std::to_string(http_status);
            if (!is_retryable_http_status(http_status)) break;
        }
        if (attempt < attempt_count) {
            std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<long long>(http_request.retry_delay_ms) * attempt));
        }
    }

    throw std::runtime_error("GET " + http_request.url + " failed: " + last_failure);
}

} // namespace API
} // namespace CanslimScanner
