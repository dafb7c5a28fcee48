/**
 * @file http_client.hpp
 * @brief Minimal blocking HTTP client over the libcurl easy interface
 *
 * Used by the uploaded-data store client and the HTTP alert sink. Each
 * request creates its own easy handle, so one HttpClient may be used from
 * several threads. Call HttpClient::GlobalInit() once at program start
 * (before any worker thread starts) and GlobalCleanup() at exit.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace auditlens {
namespace utils {

/**
 * @struct HttpResponse
 * @brief Status code and body of a completed request
 */
struct HttpResponse {
    long status_code{0};
    std::string body;

    bool Ok() const { return status_code >= 200 && status_code < 300; }
};

class HttpClient {
public:
    struct Config {
        std::chrono::seconds timeout{10};           ///< Whole-request timeout
        std::chrono::seconds connect_timeout{5};    ///< Connection phase timeout
        std::string user_agent{"auditlens/1.0"};
    };

    explicit HttpClient(const Config& config);
    explicit HttpClient();

    /**
     * @brief HTTP GET
     * @param url Absolute URL
     * @param headers Extra headers, `Name: value`
     * @throws std::runtime_error on transport failure (DNS, connect, timeout)
     */
    HttpResponse Get(const std::string& url,
                     const std::vector<std::string>& headers = {}) const;

    /**
     * @brief HTTP POST with a JSON body
     * @throws std::runtime_error on transport failure
     */
    HttpResponse PostJson(const std::string& url,
                          const std::string& body,
                          const std::vector<std::string>& headers = {}) const;

    static void GlobalInit();
    static void GlobalCleanup();

private:
    HttpResponse Perform(const std::string& url,
                         const std::string* post_body,
                         const std::vector<std::string>& headers) const;

    Config config_;
};

} // namespace utils
} // namespace auditlens
