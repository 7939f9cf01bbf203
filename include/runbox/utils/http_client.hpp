/**
 * @file http_client.hpp
 * @brief Minimal blocking HTTPS client over libcurl
 *
 * One curl easy handle per request, so a single client may be shared by
 * several threads. Transport failures (DNS, connect, TLS, timeout) throw
 * core::ProviderStatusError with status 0; HTTP error statuses are
 * returned to the caller.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace runbox {
namespace utils {

/**
 * @struct HttpResponse
 */
struct HttpResponse {
    long status_code{0};
    std::string body;

    bool Ok() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @struct MultipartField
 * @brief Text part of a multipart/form-data request
 */
struct MultipartField {
    std::string name;
    std::string value;
};

/**
 * @class HttpClient
 * @brief Bearer-token JSON client bound to one API root
 */
class HttpClient {
public:
    /**
     * @param base_url API root without trailing slash, e.g. https://api.runloop.ai
     * @param bearer_token Sent as "Authorization: Bearer <token>"
     * @param timeout Whole-request timeout
     */
    HttpClient(std::string base_url,
               std::string bearer_token,
               std::chrono::seconds timeout);

    HttpResponse Get(const std::string& path) const;

    HttpResponse PostJson(const std::string& path, const std::string& json_body) const;

    /**
     * @brief multipart/form-data POST with text fields and one file part
     */
    HttpResponse PostMultipart(const std::string& path,
                               const std::vector<MultipartField>& fields,
                               const std::string& file_field,
                               const std::filesystem::path& file_path) const;

    const std::string& BaseUrl() const { return base_url_; }

private:
    std::string base_url_;
    std::string bearer_token_;
    std::chrono::seconds timeout_;
};

} // namespace utils
} // namespace runbox
