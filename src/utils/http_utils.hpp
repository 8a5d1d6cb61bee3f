#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>

namespace MarketDesk {
namespace Utils {

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string method;
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;                   // sent only for non-GET methods
    int timeout_seconds;
    bool enable_ssl_verification;

    HttpRequest() : method("GET"), timeout_seconds(15), enable_ssl_verification(true) {}
};

struct HttpResponse {
    long status_code;
    std::string content_type;
    std::string body;

    HttpResponse() : status_code(0) {}
    HttpResponse(long status_code_value, const std::string& content_type_value, const std::string& body_value)
        : status_code(status_code_value), content_type(content_type_value), body(body_value) {}
};

/**
 * Executes one request. Implementations report a completed exchange of any
 * status as an HttpResponse and throw Core::UpstreamError (status 0) when
 * no response was received at all.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& http_request) = 0;
};

class CurlHttpTransport : public HttpTransport {
public:
    CurlHttpTransport() = default;
    HttpResponse perform(const HttpRequest& http_request) override;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string);
size_t header_callback(char* buffer, size_t size, size_t nitems, std::string* content_type);

// Replaces every "{placeholder}" occurrence with value.
std::string replace_url_placeholder(const std::string& request_url, const std::string& placeholder, const std::string& value);

std::string url_encode(const std::string& value);

} // namespace Utils
} // namespace MarketDesk

#endif // HTTP_UTILS_HPP
