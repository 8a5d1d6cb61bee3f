#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace MarketDesk {
namespace Core {

/**
 * Base of every error raised by the client. Callers that only need a
 * message can catch std::runtime_error; the command front end catches this
 * type to separate expected failures from programming errors.
 */
class MarketDeskError : public std::runtime_error {
public:
    explicit MarketDeskError(const std::string& error_message) : std::runtime_error(error_message) {}
};

// Credentials absent or malformed, invalid configuration values.
class ConfigurationError : public MarketDeskError {
public:
    explicit ConfigurationError(const std::string& error_message) : MarketDeskError(error_message) {}
};

// Caller supplied input that can never succeed (bad expiry, relative path, unknown pair).
class ValidationError : public MarketDeskError {
public:
    explicit ValidationError(const std::string& error_message) : MarketDeskError(error_message) {}
};

// Upstream returned a non-2xx status or the transport failed (status 0).
class UpstreamError : public MarketDeskError {
private:
    long status_code;
    std::string response_body;

public:
    UpstreamError(long status_code_value, const std::string& response_body_value)
        : MarketDeskError("HTTP " + std::to_string(status_code_value) + ": " + response_body_value),
          status_code(status_code_value), response_body(response_body_value) {}

    long get_status_code() const { return status_code; }
    const std::string& get_response_body() const { return response_body; }
};

// Expected row or field missing from an otherwise successful response.
class DataError : public MarketDeskError {
public:
    explicit DataError(const std::string& error_message) : MarketDeskError(error_message) {}
};

} // namespace Core
} // namespace MarketDesk

#endif // ERRORS_HPP
