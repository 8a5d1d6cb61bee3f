#include "http_gateway.hpp"
#include "core/errors.hpp"
#include "logging/logs/api_request_logs.hpp"
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace MarketDesk {
namespace API {

using MarketDesk::Logging::ApiRequestLogs;

namespace {

std::string strip_trailing_slashes(const std::string& url) {
    std::string stripped_url = url;
    while (!stripped_url.empty() && stripped_url.back() == '/') {
        stripped_url.pop_back();
    }
    return stripped_url;
}

} // anonymous namespace

HttpGateway::HttpGateway(const std::string& base_url_value, const Config::HttpConfig& http_config_ref,
                         Utils::HttpTransport& transport_ref)
    : base_url(strip_trailing_slashes(base_url_value)), http_config(http_config_ref), transport(transport_ref) {}

GatewayResponse HttpGateway::execute(const std::string& method, const std::string& path,
                                     const std::vector<std::string>& headers, const std::string& body) const {
    if (path.empty() || path[0] != '/') {
        throw Core::ValidationError("Request path must be absolute (start with '/'): " + path);
    }

    Utils::HttpRequest http_request;
    http_request.method = method;
    http_request.url = base_url + path;
    http_request.headers = headers;
    if (method != "GET") {
        http_request.body = body;
    }
    http_request.timeout_seconds = http_config.timeout_seconds;
    http_request.enable_ssl_verification = http_config.enable_ssl_verification;

    ApiRequestLogs::log_request_sent(method, http_request.url, !headers.empty());

    Utils::HttpResponse http_response;
    try {
        http_response = transport.perform(http_request);
    } catch (const Core::UpstreamError& transport_error) {
        ApiRequestLogs::log_upstream_failure(method, path, transport_error.get_status_code(),
                                             transport_error.get_response_body());
        throw;
    }

    ApiRequestLogs::log_response_received(method, path, http_response.status_code,
                                          http_response.content_type, http_response.body.size());

    if (http_response.status_code < 200 || http_response.status_code >= 300) {
        ApiRequestLogs::log_upstream_failure(method, path, http_response.status_code, http_response.body);
        throw Core::UpstreamError(http_response.status_code, http_response.body);
    }

    GatewayResponse gateway_response;
    gateway_response.status_code = http_response.status_code;
    gateway_response.content_type = http_response.content_type;
    gateway_response.raw_body = http_response.body;

    if (is_json_content_type(http_response.content_type)) {
        try {
            gateway_response.json_body = json::parse(http_response.body);
        } catch (const json::parse_error& parse_error) {
            throw Core::DataError("Malformed JSON from " + path + ": " + parse_error.what());
        }
        gateway_response.is_json = true;
    }

    return gateway_response;
}

bool HttpGateway::is_json_content_type(const std::string& content_type) {
    std::string lowered_type = content_type;
    std::transform(lowered_type.begin(), lowered_type.end(), lowered_type.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return lowered_type.find("application/json") != std::string::npos;
}

} // namespace API
} // namespace MarketDesk
