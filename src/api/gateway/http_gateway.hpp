#ifndef HTTP_GATEWAY_HPP
#define HTTP_GATEWAY_HPP

#include "configs/api_config.hpp"
#include "utils/http_utils.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace MarketDesk {
namespace API {

struct GatewayResponse {
    long status_code;
    std::string content_type;
    std::string raw_body;
    bool is_json;
    nlohmann::json json_body;   // null unless is_json

    GatewayResponse() : status_code(0), is_json(false) {}
};

/**
 * Executes calls against one API root. Signing happens before the call;
 * the gateway only sees finished header lines.
 */
class HttpGateway {
private:
    std::string base_url;
    const Config::HttpConfig& http_config;
    Utils::HttpTransport& transport;

public:
    HttpGateway(const std::string& base_url_value, const Config::HttpConfig& http_config_ref,
                Utils::HttpTransport& transport_ref);

    // Throws ValidationError for a relative path, UpstreamError for non-2xx or transport failure,
    // DataError for a JSON content type with an unparsable body.
    GatewayResponse execute(const std::string& method, const std::string& path,
                            const std::vector<std::string>& headers, const std::string& body = "") const;

    const std::string& get_base_url() const { return base_url; }

    static bool is_json_content_type(const std::string& content_type);
};

} // namespace API
} // namespace MarketDesk

#endif // HTTP_GATEWAY_HPP
