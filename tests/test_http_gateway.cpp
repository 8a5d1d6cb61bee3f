// =============================================================================
// HttpGateway Unit Tests
// Path validation, status mapping and content-type driven JSON parsing
// =============================================================================

#include <gtest/gtest.h>
#include "api/gateway/http_gateway.hpp"
#include "core/errors.hpp"
#include "fakes/fake_http_transport.hpp"

using namespace MarketDesk;
using MarketDesk::API::GatewayResponse;
using MarketDesk::API::HttpGateway;
using MarketDesk::Testing::FakeHttpTransport;

class HttpGatewayTest : public ::testing::Test {
protected:
    Config::HttpConfig http_config;
    FakeHttpTransport transport;
};

// -----------------------------------------------------------------------------
// Execute_JsonResponse_ParsesBody
// -----------------------------------------------------------------------------
TEST_F(HttpGatewayTest, Execute_JsonResponse_ParsesBody) {
    HttpGateway gateway("https://api.example.com/", http_config, transport);
    transport.enqueue_json(200, R"({"results": [1, 2]})");

    GatewayResponse gateway_response = gateway.execute("GET", "/v1/things", {"x-api-key: k"});

    EXPECT_EQ(gateway_response.status_code, 200);
    ASSERT_TRUE(gateway_response.is_json);
    EXPECT_EQ(gateway_response.json_body["results"].size(), 2u);
    EXPECT_EQ(transport.last_request().url, "https://api.example.com/v1/things");
    EXPECT_EQ(transport.last_request().method, "GET");
    ASSERT_EQ(transport.last_request().headers.size(), 1u);
}

// -----------------------------------------------------------------------------
// Execute_TextResponse_ReturnsRawBodyOnly
// -----------------------------------------------------------------------------
TEST_F(HttpGatewayTest, Execute_TextResponse_ReturnsRawBodyOnly) {
    HttpGateway gateway("https://api.example.com", http_config, transport);
    transport.enqueue_text(200, "pong");

    GatewayResponse gateway_response = gateway.execute("GET", "/ping", {});

    EXPECT_FALSE(gateway_response.is_json);
    EXPECT_TRUE(gateway_response.json_body.is_null());
    EXPECT_EQ(gateway_response.raw_body, "pong");
}

// -----------------------------------------------------------------------------
// Execute_RelativePath_ThrowsValidationErrorWithoutRequest
// -----------------------------------------------------------------------------
TEST_F(HttpGatewayTest, Execute_RelativePath_ThrowsValidationErrorWithoutRequest) {
    HttpGateway gateway("https://api.example.com", http_config, transport);

    EXPECT_THROW(gateway.execute("GET", "v1/things", {}), Core::ValidationError);
    EXPECT_THROW(gateway.execute("GET", "", {}), Core::ValidationError);
    EXPECT_TRUE(transport.recorded_requests.empty());
}

// -----------------------------------------------------------------------------
// Execute_Non2xx_ThrowsUpstreamErrorWithStatusAndBody
// -----------------------------------------------------------------------------
TEST_F(HttpGatewayTest, Execute_Non2xx_ThrowsUpstreamErrorWithStatusAndBody) {
    HttpGateway gateway("https://api.example.com", http_config, transport);
    transport.enqueue_json(401, R"({"detail":"bad signature"})");

    try {
        gateway.execute("GET", "/v1/orders", {});
        FAIL() << "Expected UpstreamError";
    } catch (const Core::UpstreamError& upstream_error) {
        EXPECT_EQ(upstream_error.get_status_code(), 401);
        EXPECT_EQ(upstream_error.get_response_body(), R"({"detail":"bad signature"})");
        EXPECT_EQ(std::string(upstream_error.what()), R"(HTTP 401: {"detail":"bad signature"})");
    }
}

// -----------------------------------------------------------------------------
// Execute_TransportFailure_PropagatesStatusZero
// -----------------------------------------------------------------------------
TEST_F(HttpGatewayTest, Execute_TransportFailure_PropagatesStatusZero) {
    HttpGateway gateway("https://api.example.com", http_config, transport);
    transport.fail_transport = true;

    try {
        gateway.execute("GET", "/v1/orders", {});
        FAIL() << "Expected UpstreamError";
    } catch (const Core::UpstreamError& upstream_error) {
        EXPECT_EQ(upstream_error.get_status_code(), 0);
    }
}

// -----------------------------------------------------------------------------
// Execute_MalformedJson_ThrowsDataError
// -----------------------------------------------------------------------------
TEST_F(HttpGatewayTest, Execute_MalformedJson_ThrowsDataError) {
    HttpGateway gateway("https://api.example.com", http_config, transport);
    transport.enqueue_json(200, "{ invalid json");

    EXPECT_THROW(gateway.execute("GET", "/v1/orders", {}), Core::DataError);
}

// -----------------------------------------------------------------------------
// Execute_BodySentOnlyForNonGet
// -----------------------------------------------------------------------------
TEST_F(HttpGatewayTest, Execute_BodySentOnlyForNonGet) {
    HttpGateway gateway("https://api.example.com", http_config, transport);
    transport.enqueue_json(200, "{}");
    transport.enqueue_json(201, "{}");

    gateway.execute("GET", "/v1/orders", {}, R"({"ignored":true})");
    EXPECT_TRUE(transport.recorded_requests[0].body.empty());

    gateway.execute("POST", "/v1/orders", {}, R"({"side":"buy"})");
    EXPECT_EQ(transport.recorded_requests[1].body, R"({"side":"buy"})");
}

// -----------------------------------------------------------------------------
// Execute_AppliesHttpConfig
// -----------------------------------------------------------------------------
TEST_F(HttpGatewayTest, Execute_AppliesHttpConfig) {
    http_config.timeout_seconds = 7;
    http_config.enable_ssl_verification = false;
    HttpGateway gateway("https://api.example.com", http_config, transport);
    transport.enqueue_json(200, "{}");

    gateway.execute("GET", "/v1/orders", {});
    EXPECT_EQ(transport.last_request().timeout_seconds, 7);
    EXPECT_FALSE(transport.last_request().enable_ssl_verification);
}

// -----------------------------------------------------------------------------
// IsJsonContentType_MatchesCaseInsensitively
// -----------------------------------------------------------------------------
TEST(HttpGatewayStaticTest, IsJsonContentType_MatchesCaseInsensitively) {
    EXPECT_TRUE(HttpGateway::is_json_content_type("application/json"));
    EXPECT_TRUE(HttpGateway::is_json_content_type("Application/JSON; charset=utf-8"));
    EXPECT_FALSE(HttpGateway::is_json_content_type("text/html"));
    EXPECT_FALSE(HttpGateway::is_json_content_type(""));
}
