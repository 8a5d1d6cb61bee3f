// =============================================================================
// RequestSigner Unit Tests
// HMAC and Ed25519 message layout, determinism, headers and key errors
// =============================================================================

#include <gtest/gtest.h>
#include "api/signing/ed25519_request_signer.hpp"
#include "api/signing/hmac_request_signer.hpp"
#include "api/signing/request_signer_factory.hpp"
#include "core/errors.hpp"
#include "utils/base64_utils.hpp"
#include "fakes/test_configs.hpp"
#include <openssl/evp.h>
#include <memory>

using namespace MarketDesk;
using MarketDesk::API::Ed25519RequestSigner;
using MarketDesk::API::HmacRequestSigner;
using MarketDesk::API::RequestSignature;
using MarketDesk::API::SigningContext;

namespace {

const std::string ORDERS_PATH = "/api/v1/crypto/trading/orders/?limit=3";

std::vector<unsigned char> hex_to_bytes(const std::string& hex_string) {
    std::vector<unsigned char> bytes;
    for (size_t i = 0; i + 1 < hex_string.size(); i += 2) {
        bytes.push_back(static_cast<unsigned char>(std::stoi(hex_string.substr(i, 2), nullptr, 16)));
    }
    return bytes;
}

bool verify_ed25519(const std::vector<unsigned char>& public_key, const std::string& message,
                    const std::vector<unsigned char>& signature) {
    EVP_PKEY* verify_key = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size());
    EVP_MD_CTX* verify_context = EVP_MD_CTX_new();
    bool verified = verify_key && verify_context &&
        EVP_DigestVerifyInit(verify_context, nullptr, nullptr, nullptr, verify_key) == 1 &&
        EVP_DigestVerify(verify_context, signature.data(), signature.size(),
                         reinterpret_cast<const unsigned char*>(message.data()), message.size()) == 1;
    EVP_MD_CTX_free(verify_context);
    EVP_PKEY_free(verify_key);
    return verified;
}

} // anonymous namespace

// -----------------------------------------------------------------------------
// HmacDigest_MatchesRfc4231Vector
// -----------------------------------------------------------------------------
TEST(HmacRequestSignerTest, HmacDigest_MatchesRfc4231Vector) {
    EXPECT_EQ(HmacRequestSigner::compute_hmac_sha256_base64("Jefe", "what do ya want for nothing?"),
              "W9zBRr9gdU5qBCQmCJV1x1oAPwidJzmDnexYuWTsOEM=");
}

// -----------------------------------------------------------------------------
// BuildMessage_TimestampUpperMethodPathBody
// -----------------------------------------------------------------------------
TEST(HmacRequestSignerTest, BuildMessage_TimestampUpperMethodPathBody) {
    Config::SystemConfig config = Testing::make_live_hmac_config();
    HmacRequestSigner signer(config.credentials);

    SigningContext context("post", "/api/v1/orders/", "{\"a\":1}", "1700000000000", config.credentials);
    EXPECT_EQ(signer.build_message(context), "1700000000000POST/api/v1/orders/{\"a\":1}");
}

// -----------------------------------------------------------------------------
// SignContext_KnownAnswer
// -----------------------------------------------------------------------------
TEST(HmacRequestSignerTest, SignContext_KnownAnswer) {
    Config::SystemConfig config = Testing::make_live_hmac_config();
    HmacRequestSigner signer(config.credentials);

    SigningContext context("GET", ORDERS_PATH, "", "1700000000000", config.credentials);
    RequestSignature request_signature = signer.sign_context(context);
    EXPECT_EQ(request_signature.timestamp, "1700000000000");
    EXPECT_EQ(request_signature.signature, "cnNO7SJOD/OoBN7d/fMo6ibbLGctO7nZAJopown3Pb4=");
}

// -----------------------------------------------------------------------------
// SignContext_DeterministicAndTimestampSensitive
// -----------------------------------------------------------------------------
TEST(HmacRequestSignerTest, SignContext_DeterministicAndTimestampSensitive) {
    Config::SystemConfig config = Testing::make_live_hmac_config();
    HmacRequestSigner signer(config.credentials);

    SigningContext first_context("GET", ORDERS_PATH, "", "1700000000000", config.credentials);
    SigningContext repeat_context("GET", ORDERS_PATH, "", "1700000000000", config.credentials);
    SigningContext later_context("GET", ORDERS_PATH, "", "1700000000001", config.credentials);

    EXPECT_EQ(signer.sign_context(first_context).signature, signer.sign_context(repeat_context).signature);
    EXPECT_NE(signer.sign_context(first_context).signature, signer.sign_context(later_context).signature);
}

// -----------------------------------------------------------------------------
// Sign_UsesMillisecondTimestamp
// -----------------------------------------------------------------------------
TEST(HmacRequestSignerTest, Sign_UsesMillisecondTimestamp) {
    Config::SystemConfig config = Testing::make_live_hmac_config();
    HmacRequestSigner signer(config.credentials);

    RequestSignature request_signature = signer.sign("GET", ORDERS_PATH, "");
    EXPECT_EQ(request_signature.timestamp.size(), 13u);
    EXPECT_FALSE(request_signature.signature.empty());
}

// -----------------------------------------------------------------------------
// BuildSignedHeaders_IncludesClientIdAndJsonNegotiation
// -----------------------------------------------------------------------------
TEST(HmacRequestSignerTest, BuildSignedHeaders_IncludesClientIdAndJsonNegotiation) {
    Config::SystemConfig config = Testing::make_live_hmac_config();
    HmacRequestSigner signer(config.credentials);

    RequestSignature request_signature{"1700000000000", "c2ln"};
    std::vector<std::string> headers = signer.build_signed_headers(request_signature);

    EXPECT_TRUE(Testing::has_header(headers, "X-Robinhood-API-Key: test-key"));
    EXPECT_TRUE(Testing::has_header(headers, "X-Robinhood-Client-Id: client-7"));
    EXPECT_TRUE(Testing::has_header(headers, "X-Robinhood-Signature: c2ln"));
    EXPECT_TRUE(Testing::has_header(headers, "X-Robinhood-Timestamp: 1700000000000"));
    EXPECT_TRUE(Testing::has_header(headers, "Content-Type: application/json; charset=utf-8"));
    EXPECT_TRUE(Testing::has_header(headers, "Accept: application/json"));
}

// -----------------------------------------------------------------------------
// SignContext_MissingSecret_ThrowsConfigurationError
// -----------------------------------------------------------------------------
TEST(HmacRequestSignerTest, SignContext_MissingSecret_ThrowsConfigurationError) {
    Config::SystemConfig config = Testing::make_live_hmac_config();
    config.credentials.api_secret.clear();
    HmacRequestSigner signer(config.credentials);

    SigningContext context("GET", ORDERS_PATH, "", "1700000000000", config.credentials);
    EXPECT_THROW(signer.sign_context(context), Core::ConfigurationError);
}

// -----------------------------------------------------------------------------
// DerivePublicKey_MatchesRfc8032Vector
// -----------------------------------------------------------------------------
TEST(Ed25519RequestSignerTest, DerivePublicKey_MatchesRfc8032Vector) {
    std::vector<unsigned char> seed = Ed25519RequestSigner::decode_seed(Testing::ED25519_TEST_SEED_BASE64);
    EXPECT_EQ(Ed25519RequestSigner::derive_public_key(seed),
              hex_to_bytes("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"));
}

// -----------------------------------------------------------------------------
// BuildMessage_KeyTimestampPathMethodBody
// -----------------------------------------------------------------------------
TEST(Ed25519RequestSignerTest, BuildMessage_KeyTimestampPathMethodBody) {
    Config::SystemConfig config = Testing::make_live_ed25519_config();
    Ed25519RequestSigner signer(config.credentials);

    SigningContext context("GET", ORDERS_PATH, "", "1700000000", config.credentials);
    EXPECT_EQ(signer.build_message(context), "test-key1700000000" + ORDERS_PATH + "GET");
}

// -----------------------------------------------------------------------------
// SignContext_VerifiesAgainstDerivedPublicKey
// -----------------------------------------------------------------------------
TEST(Ed25519RequestSignerTest, SignContext_VerifiesAgainstDerivedPublicKey) {
    Config::SystemConfig config = Testing::make_live_ed25519_config();
    Ed25519RequestSigner signer(config.credentials);

    SigningContext context("GET", ORDERS_PATH, "", "1700000000", config.credentials);
    RequestSignature request_signature = signer.sign_context(context);
    std::vector<unsigned char> signature_bytes = Utils::base64_decode(request_signature.signature);
    ASSERT_EQ(signature_bytes.size(), 64u);

    std::vector<unsigned char> seed = Ed25519RequestSigner::decode_seed(config.credentials.private_key_seed);
    std::vector<unsigned char> public_key = Ed25519RequestSigner::derive_public_key(seed);
    EXPECT_TRUE(verify_ed25519(public_key, signer.build_message(context), signature_bytes));
    EXPECT_FALSE(verify_ed25519(public_key, signer.build_message(context) + "x", signature_bytes));
}

// -----------------------------------------------------------------------------
// SignContext_DeterministicAndTimestampSensitive
// -----------------------------------------------------------------------------
TEST(Ed25519RequestSignerTest, SignContext_DeterministicAndTimestampSensitive) {
    Config::SystemConfig config = Testing::make_live_ed25519_config();
    Ed25519RequestSigner signer(config.credentials);

    SigningContext first_context("GET", ORDERS_PATH, "", "1700000000", config.credentials);
    SigningContext repeat_context("GET", ORDERS_PATH, "", "1700000000", config.credentials);
    SigningContext later_context("GET", ORDERS_PATH, "", "1700000001", config.credentials);

    EXPECT_EQ(signer.sign_context(first_context).signature, signer.sign_context(repeat_context).signature);
    EXPECT_NE(signer.sign_context(first_context).signature, signer.sign_context(later_context).signature);
}

// -----------------------------------------------------------------------------
// Sign_UsesSecondTimestampAndLowercaseHeaders
// -----------------------------------------------------------------------------
TEST(Ed25519RequestSignerTest, Sign_UsesSecondTimestampAndLowercaseHeaders) {
    Config::SystemConfig config = Testing::make_live_ed25519_config();
    Ed25519RequestSigner signer(config.credentials);

    RequestSignature request_signature = signer.sign("GET", ORDERS_PATH, "");
    EXPECT_EQ(request_signature.timestamp.size(), 10u);

    std::vector<std::string> headers = signer.build_signed_headers(request_signature);
    EXPECT_TRUE(Testing::has_header(headers, "x-api-key: test-key"));
    EXPECT_TRUE(Testing::has_header(headers, "x-signature: " + request_signature.signature));
    EXPECT_TRUE(Testing::has_header(headers, "x-timestamp: " + request_signature.timestamp));
    EXPECT_FALSE(Testing::has_header(headers, "X-Robinhood-"));
}

// -----------------------------------------------------------------------------
// SignContext_ShortSeed_ThrowsValidationError
// -----------------------------------------------------------------------------
TEST(Ed25519RequestSignerTest, SignContext_ShortSeed_ThrowsValidationError) {
    Config::SystemConfig config = Testing::make_live_ed25519_config();
    config.credentials.private_key_seed = "AAECAwQFBgcICQoLDA0ODw==";   // 16 bytes
    Ed25519RequestSigner signer(config.credentials);

    SigningContext context("GET", ORDERS_PATH, "", "1700000000", config.credentials);
    EXPECT_THROW(signer.sign_context(context), Core::ValidationError);
}

// -----------------------------------------------------------------------------
// SignContext_InvalidBase64Seed_ThrowsValidationError
// -----------------------------------------------------------------------------
TEST(Ed25519RequestSignerTest, SignContext_InvalidBase64Seed_ThrowsValidationError) {
    Config::SystemConfig config = Testing::make_live_ed25519_config();
    config.credentials.private_key_seed = "not*base64";
    Ed25519RequestSigner signer(config.credentials);

    SigningContext context("GET", ORDERS_PATH, "", "1700000000", config.credentials);
    EXPECT_THROW(signer.sign_context(context), Core::ValidationError);
}

// -----------------------------------------------------------------------------
// SignContext_MissingSeed_ThrowsConfigurationError
// -----------------------------------------------------------------------------
TEST(Ed25519RequestSignerTest, SignContext_MissingSeed_ThrowsConfigurationError) {
    Config::SystemConfig config = Testing::make_live_ed25519_config();
    config.credentials.private_key_seed.clear();
    Ed25519RequestSigner signer(config.credentials);

    SigningContext context("GET", ORDERS_PATH, "", "1700000000", config.credentials);
    EXPECT_THROW(signer.sign_context(context), Core::ConfigurationError);
}

// -----------------------------------------------------------------------------
// CreateRequestSigner_FollowsConfiguredScheme
// -----------------------------------------------------------------------------
TEST(RequestSignerFactoryTest, CreateRequestSigner_FollowsConfiguredScheme) {
    Config::SystemConfig hmac_config = Testing::make_live_hmac_config();
    Config::SystemConfig ed25519_config = Testing::make_live_ed25519_config();

    EXPECT_EQ(API::create_request_signer(hmac_config)->get_scheme(), Config::SigningScheme::HMAC_SHA256);
    EXPECT_EQ(API::create_request_signer(ed25519_config)->get_scheme(), Config::SigningScheme::ED25519);
}
