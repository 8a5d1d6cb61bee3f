#include "http_utils.hpp"
#include "core/errors.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace MarketDesk {
namespace Utils {

namespace {

class CurlHandleGuard {
private:
    CURL* curl_handle;
    struct curl_slist* header_list;

public:
    CurlHandleGuard() : curl_handle(curl_easy_init()), header_list(nullptr) {}
    ~CurlHandleGuard() {
        if (header_list) {
            curl_slist_free_all(header_list);
        }
        if (curl_handle) {
            curl_easy_cleanup(curl_handle);
        }
    }

    CurlHandleGuard(const CurlHandleGuard&) = delete;
    CurlHandleGuard& operator=(const CurlHandleGuard&) = delete;

    CURL* get() const { return curl_handle; }

    void append_header(const std::string& header_line) {
        struct curl_slist* appended_list = curl_slist_append(header_list, header_line.c_str());
        if (!appended_list) {
            throw std::runtime_error("Failed to append HTTP header");
        }
        header_list = appended_list;
    }

    struct curl_slist* headers() const { return header_list; }
};

std::string to_lower_copy(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return lowered;
}

std::string trim_header_value(const std::string& value) {
    size_t start_position = value.find_first_not_of(" \t");
    if (start_position == std::string::npos) {
        return "";
    }
    size_t end_position = value.find_last_not_of(" \t\r\n");
    return value.substr(start_position, end_position - start_position + 1);
}

} // anonymous namespace

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, std::string* content_type) {
    size_t header_length = size * nitems;
    std::string header_line(buffer, header_length);
    size_t colon_position = header_line.find(':');
    if (colon_position != std::string::npos &&
        to_lower_copy(header_line.substr(0, colon_position)) == "content-type") {
        *content_type = trim_header_value(header_line.substr(colon_position + 1));
    }
    return header_length;
}

HttpResponse CurlHttpTransport::perform(const HttpRequest& http_request) {
    CurlHandleGuard curl_guard;
    if (!curl_guard.get()) {
        throw std::runtime_error("Failed to initialize CURL for HTTP " + http_request.method + " request");
    }

    HttpResponse http_response;
    for (const std::string& header_line : http_request.headers) {
        curl_guard.append_header(header_line);
    }

    CURL* curl_handle = curl_guard.get();
    curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, curl_guard.headers());
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &http_response.body);
    curl_easy_setopt(curl_handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_handle, CURLOPT_HEADERDATA, &http_response.content_type);
    curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);

    if (http_request.method == "GET") {
        curl_easy_setopt(curl_handle, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, http_request.method.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, http_request.body.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(http_request.body.size()));
    }

    CURLcode curl_result = curl_easy_perform(curl_handle);
    if (curl_result != CURLE_OK) {
        throw Core::UpstreamError(0, std::string(curl_easy_strerror(curl_result)) + " URL: " + http_request.url);
    }

    curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_response.status_code);
    return http_response;
}

std::string replace_url_placeholder(const std::string& request_url, const std::string& placeholder, const std::string& value) {
    std::string result_url = request_url;
    const std::string placeholder_token = "{" + placeholder + "}";
    size_t placeholder_position = result_url.find(placeholder_token);
    while (placeholder_position != std::string::npos) {
        result_url.replace(placeholder_position, placeholder_token.size(), value);
        placeholder_position = result_url.find(placeholder_token, placeholder_position + value.size());
    }
    return result_url;
}

std::string url_encode(const std::string& value) {
    char* escaped_value = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
    if (!escaped_value) {
        throw std::runtime_error("Failed to URL-encode value");
    }
    std::string encoded_value(escaped_value);
    curl_free(escaped_value);
    return encoded_value;
}

} // namespace Utils
} // namespace MarketDesk
