#ifndef BASE64_UTILS_HPP
#define BASE64_UTILS_HPP

#include <string>
#include <vector>

namespace MarketDesk {
namespace Utils {

std::string base64_encode(const unsigned char* input_bytes, size_t input_length);
std::string base64_encode(const std::vector<unsigned char>& input_bytes);

// Throws Core::ValidationError when the input is not valid base64.
std::vector<unsigned char> base64_decode(const std::string& encoded_string);

} // namespace Utils
} // namespace MarketDesk

#endif // BASE64_UTILS_HPP
