#include "base64_utils.hpp"
#include "core/errors.hpp"
#include <openssl/evp.h>

namespace MarketDesk {
namespace Utils {

namespace {
    std::string strip_whitespace(const std::string& input_string) {
        std::string stripped_string;
        stripped_string.reserve(input_string.size());
        for (char input_char : input_string) {
            if (input_char != ' ' && input_char != '\t' && input_char != '\r' && input_char != '\n') {
                stripped_string.push_back(input_char);
            }
        }
        return stripped_string;
    }
}

std::string base64_encode(const unsigned char* input_bytes, size_t input_length) {
    if (input_length == 0) {
        return "";
    }

    std::string encoded_string(4 * ((input_length + 2) / 3), '\0');
    int encoded_length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded_string[0]),
                                         input_bytes, static_cast<int>(input_length));
    encoded_string.resize(static_cast<size_t>(encoded_length));
    return encoded_string;
}

std::string base64_encode(const std::vector<unsigned char>& input_bytes) {
    return base64_encode(input_bytes.data(), input_bytes.size());
}

std::vector<unsigned char> base64_decode(const std::string& encoded_string) {
    std::string clean_string = strip_whitespace(encoded_string);
    if (clean_string.empty()) {
        return {};
    }
    if (clean_string.size() % 4 != 0) {
        throw Core::ValidationError("Invalid base64 input: length must be a multiple of 4");
    }

    std::vector<unsigned char> decoded_bytes(3 * clean_string.size() / 4);
    int decoded_length = EVP_DecodeBlock(decoded_bytes.data(),
                                         reinterpret_cast<const unsigned char*>(clean_string.data()),
                                         static_cast<int>(clean_string.size()));
    if (decoded_length < 0) {
        throw Core::ValidationError("Invalid base64 input");
    }

    // EVP_DecodeBlock counts padding characters as zero bytes
    size_t padding_count = 0;
    if (clean_string[clean_string.size() - 1] == '=') {
        padding_count++;
    }
    if (clean_string[clean_string.size() - 2] == '=') {
        padding_count++;
    }

    decoded_bytes.resize(static_cast<size_t>(decoded_length) - padding_count);
    return decoded_bytes;
}

} // namespace Utils
} // namespace MarketDesk
