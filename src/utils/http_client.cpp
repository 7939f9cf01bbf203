/**
 * @file http_client.cpp
 * @brief libcurl implementation of the HTTP client
 *
 * @date 2025
 */

#include "runbox/utils/http_client.hpp"

#include "runbox/core/errors.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <utility>

namespace runbox {
namespace utils {

namespace {

std::once_flag curl_init_flag;

void EnsureCurlInitialized() {
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

size_t WriteCallback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct MimeDeleter {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;
using MimeHandle = std::unique_ptr<curl_mime, MimeDeleter>;

HeaderList AppendHeader(HeaderList list, const std::string& header) {
    curl_slist* raw = curl_slist_append(list.get(), header.c_str());
    if (raw == nullptr) {
        throw core::ProviderStatusError(0, "Out of memory building request headers");
    }
    list.release();
    return HeaderList(raw);
}

} // namespace

HttpClient::HttpClient(std::string base_url,
                       std::string bearer_token,
                       std::chrono::seconds timeout)
    : base_url_(std::move(base_url))
    , bearer_token_(std::move(bearer_token))
    , timeout_(timeout) {
    EnsureCurlInitialized();
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

namespace {

HttpResponse Perform(CURL* curl, const std::string& method, const std::string& url) {
    HttpResponse response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "runbox/1.0");

    spdlog::debug("HTTP {} {}", method, url);
    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        std::string message = error_buffer[0] ? error_buffer : curl_easy_strerror(rc);
        spdlog::debug("HTTP {} {} failed: {}", method, url, message);
        throw core::ProviderStatusError(0, method + " " + url + ": " + message);
    }

    rc = curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    if (rc != CURLE_OK) {
        throw core::ProviderStatusError(0, method + " " + url + ": cannot read response status: "
                                           + curl_easy_strerror(rc));
    }
    spdlog::debug("HTTP {} {} -> {}", method, url, response.status_code);
    return response;
}

} // namespace

HttpResponse HttpClient::Get(const std::string& path) const {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw core::ProviderStatusError(0, "curl_easy_init failed");
    }

    HeaderList headers;
    headers = AppendHeader(std::move(headers), "Authorization: Bearer " + bearer_token_);
    headers = AppendHeader(std::move(headers), "Accept: application/json");

    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));

    return Perform(curl.get(), "GET", base_url_ + path);
}

HttpResponse HttpClient::PostJson(const std::string& path, const std::string& json_body) const {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw core::ProviderStatusError(0, "curl_easy_init failed");
    }

    HeaderList headers;
    headers = AppendHeader(std::move(headers), "Authorization: Bearer " + bearer_token_);
    headers = AppendHeader(std::move(headers), "Content-Type: application/json");
    headers = AppendHeader(std::move(headers), "Accept: application/json");

    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));

    return Perform(curl.get(), "POST", base_url_ + path);
}

HttpResponse HttpClient::PostMultipart(const std::string& path,
                                       const std::vector<MultipartField>& fields,
                                       const std::string& file_field,
                                       const std::filesystem::path& file_path) const {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw core::ProviderStatusError(0, "curl_easy_init failed");
    }

    MimeHandle mime(curl_mime_init(curl.get()));
    for (const auto& field : fields) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, field.name.c_str());
        curl_mime_data(part, field.value.c_str(), CURL_ZERO_TERMINATED);
    }

    curl_mimepart* file_part = curl_mime_addpart(mime.get());
    curl_mime_name(file_part, file_field.c_str());
    if (curl_mime_filedata(file_part, file_path.c_str()) != CURLE_OK) {
        throw core::ProviderStatusError(0, "Cannot attach " + file_path.string());
    }

    HeaderList headers;
    headers = AppendHeader(std::move(headers), "Authorization: Bearer " + bearer_token_);
    headers = AppendHeader(std::move(headers), "Accept: application/json");

    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));

    return Perform(curl.get(), "POST", base_url_ + path);
}

} // namespace utils
} // namespace runbox
