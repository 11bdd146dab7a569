#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include "api/general/http_client_interface.hpp"

namespace CanslimScanner {
namespace API {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string);

// Replaces every {symbol} placeholder in a configured URL.
std::string replace_url_placeholder(const std::string& request_url, const std::string& symbol);

// Status codes worth another attempt (rate limiting and transient server errors).
bool is_retryable_http_status(long http_response_code);

// libcurl global state; construct once in main before any worker thread starts.
class CurlGlobalInitializer {
public:
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();

    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

class CurlHttpClient : public HttpClientInterface {
public:
    std::string get(const HttpRequest& http_request) const override;
};

} // namespace API
} // namespace CanslimScanner

#endif // HTTP_UTILS_HPP
