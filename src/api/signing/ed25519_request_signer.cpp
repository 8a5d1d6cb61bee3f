#include "ed25519_request_signer.hpp"
#include "core/errors.hpp"
#include "utils/base64_utils.hpp"
#include "utils/time_utils.hpp"
#include <openssl/evp.h>
#include <memory>

namespace MarketDesk {
namespace API {

namespace {

constexpr size_t ED25519_SEED_LENGTH = 32;
constexpr size_t ED25519_PUBLIC_KEY_LENGTH = 32;
constexpr size_t ED25519_SIGNATURE_LENGTH = 64;

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* context) const { EVP_MD_CTX_free(context); }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

EvpPkeyPtr load_private_key(const std::vector<unsigned char>& seed) {
    if (seed.size() != ED25519_SEED_LENGTH) {
        throw Core::ValidationError("Ed25519 seed must be exactly 32 bytes, got " + std::to_string(seed.size()));
    }
    EvpPkeyPtr private_key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
    if (!private_key) {
        throw std::runtime_error("Failed to load Ed25519 private key");
    }
    return private_key;
}

} // anonymous namespace

Ed25519RequestSigner::Ed25519RequestSigner(const Config::CredentialConfig& credential_config)
    : RequestSigner(credential_config) {}

RequestSignature Ed25519RequestSigner::sign_context(const SigningContext& context) const {
    if (context.credentials.private_key_seed.empty()) {
        throw Core::ConfigurationError("Ed25519 signing requires a private key seed (api.private_key_seed / RH_PRIVATE_KEY)");
    }
    if (context.credentials.api_key.empty()) {
        throw Core::ConfigurationError("Ed25519 signing requires an API key (api.api_key / RH_API_KEY)");
    }

    std::vector<unsigned char> seed = decode_seed(context.credentials.private_key_seed);

    RequestSignature request_signature;
    request_signature.timestamp = context.timestamp;
    request_signature.signature = Utils::base64_encode(sign_message(seed, build_message(context)));
    return request_signature;
}

std::string Ed25519RequestSigner::build_message(const SigningContext& context) const {
    return context.credentials.api_key + context.timestamp + context.path + context.method + context.body;
}

std::string Ed25519RequestSigner::current_timestamp() const {
    return std::to_string(TimeUtils::get_current_epoch_seconds());
}

std::vector<std::string> Ed25519RequestSigner::build_auth_headers(const RequestSignature& request_signature) const {
    std::vector<std::string> headers;
    headers.push_back("x-api-key: " + credentials.api_key);
    headers.push_back("x-signature: " + request_signature.signature);
    headers.push_back("x-timestamp: " + request_signature.timestamp);
    return headers;
}

Config::SigningScheme Ed25519RequestSigner::get_scheme() const {
    return Config::SigningScheme::ED25519;
}

std::vector<unsigned char> Ed25519RequestSigner::decode_seed(const std::string& seed_base64) {
    std::vector<unsigned char> seed;
    try {
        seed = Utils::base64_decode(seed_base64);
    } catch (const Core::ValidationError& decode_error) {
        throw Core::ValidationError(std::string("Ed25519 private key seed is not valid base64: ") + decode_error.what());
    }
    if (seed.size() != ED25519_SEED_LENGTH) {
        throw Core::ValidationError("Ed25519 private key seed must decode to 32 bytes, got " + std::to_string(seed.size()));
    }
    return seed;
}

std::vector<unsigned char> Ed25519RequestSigner::derive_public_key(const std::vector<unsigned char>& seed) {
    EvpPkeyPtr private_key = load_private_key(seed);

    std::vector<unsigned char> public_key(ED25519_PUBLIC_KEY_LENGTH);
    size_t public_key_length = public_key.size();
    if (EVP_PKEY_get_raw_public_key(private_key.get(), public_key.data(), &public_key_length) != 1) {
        throw std::runtime_error("Failed to derive Ed25519 public key");
    }
    public_key.resize(public_key_length);
    return public_key;
}

std::vector<unsigned char> Ed25519RequestSigner::sign_message(const std::vector<unsigned char>& seed, const std::string& message) {
    EvpPkeyPtr private_key = load_private_key(seed);

    EvpMdCtxPtr digest_context(EVP_MD_CTX_new());
    if (!digest_context) {
        throw std::runtime_error("Failed to allocate signing context");
    }
    // Ed25519 is a one-shot signature: no digest is configured.
    if (EVP_DigestSignInit(digest_context.get(), nullptr, nullptr, nullptr, private_key.get()) != 1) {
        throw std::runtime_error("Failed to initialize Ed25519 signing");
    }

    std::vector<unsigned char> signature(ED25519_SIGNATURE_LENGTH);
    size_t signature_length = signature.size();
    if (EVP_DigestSign(digest_context.get(), signature.data(), &signature_length,
                       reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1) {
        throw std::runtime_error("Ed25519 signing failed");
    }
    signature.resize(signature_length);
    return signature;
}

} // namespace API
} // namespace MarketDesk
