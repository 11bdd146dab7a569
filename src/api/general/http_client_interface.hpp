#ifndef HTTP_CLIENT_INTERFACE_HPP
#define HTTP_CLIENT_INTERFACE_HPP

#include <memory>
#include <string>
#include <vector>

namespace CanslimScanner {
namespace API {

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;
    std::string user_agent;
    int retries;
    int timeout_seconds;
    int retry_delay_ms;
    bool enable_ssl_verification;

    HttpRequest(const std::string& request_url, int retry_count = 3, int timeout = 20, int retry_delay = 500, bool ssl_verify = true)
        : url(request_url), headers(), user_agent(""), retries(retry_count), timeout_seconds(timeout),
          retry_delay_ms(retry_delay), enable_ssl_verification(ssl_verify) {}
};

// Blocking GET returning the response body. Throws std::runtime_error after the last failed attempt.
class HttpClientInterface {
public:
    virtual ~HttpClientInterface() = default;

    virtual std::string get(const HttpRequest& http_request) const = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClientInterface>;

} // namespace API
} // namespace CanslimScanner

#endif // HTTP_CLIENT_INTERFACE_HPP
