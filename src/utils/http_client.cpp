/**
 * @file http_client.cpp
 * @brief libcurl-backed HTTP requests
 *
 * @date 2025
 */

#include "auditlens/utils/http_client.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>

namespace auditlens {
namespace utils {

namespace {

// Callback for curl response body
std::size_t WriteCallback(void* contents, std::size_t size, std::size_t nmemb, std::string* output) {
    std::size_t total = size * nmemb;
    output->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // anonymous namespace

HttpClient::HttpClient(const Config& config)
    : config_(config) {
}

HttpClient::HttpClient()
    : HttpClient(Config{}) {
}

void HttpClient::GlobalInit() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void HttpClient::GlobalCleanup() {
    curl_global_cleanup();
}

HttpResponse HttpClient::Get(const std::string& url,
                             const std::vector<std::string>& headers) const {
    return Perform(url, nullptr, headers);
}

HttpResponse HttpClient::PostJson(const std::string& url,
                                  const std::string& body,
                                  const std::vector<std::string>& headers) const {
    std::vector<std::string> all_headers = headers;
    all_headers.push_back("Content-Type: application/json");
    return Perform(url, &body, all_headers);
}

HttpResponse HttpClient::Perform(const std::string& url,
                                 const std::string* post_body,
                                 const std::vector<std::string>& headers) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("Failed to initialize curl handle");
    }

    curl_slist* raw_headers = nullptr;
    for (const auto& header : headers) {
        raw_headers = curl_slist_append(raw_headers, header.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_headers);

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(config_.connect_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    if (post_body != nullptr) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw std::runtime_error("HTTP request to " + url + " failed: " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    spdlog::debug("{} {} -> {}", post_body ? "POST" : "GET", url, response.status_code);

    return response;
}

} // namespace utils
} // namespace auditlens
