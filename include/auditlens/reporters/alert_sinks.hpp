/**
 * @file alert_sinks.hpp
 * @brief AlertSink implementations: alert API client and JSON-lines file
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>

#include "auditlens/reporters/alert_emitter.hpp"
#include "auditlens/utils/http_client.hpp"

namespace auditlens {
namespace reporters {

/**
 * @class HttpAlertSink
 * @brief Posts alerts to `POST {api_base_url}/api/alerts`
 *
 * The API answers `{ "success": true, "alert": {...} }`; the returned alert
 * (with its server-side id) is what ends up in the task result.
 */
class HttpAlertSink : public AlertSink {
public:
    struct Config {
        std::string api_base_url{"http://api:3000"};
        std::string service_token;                  ///< Sent as `x-service-token`
        std::chrono::seconds timeout{10};
    };

    explicit HttpAlertSink(const Config& config);

    AlertPostResult PostAlert(const Alert& alert) override;

private:
    Config config_;
    utils::HttpClient client_;
};

/**
 * @class JsonFileAlertSink
 * @brief Appends one alert document per line to a file
 */
class JsonFileAlertSink : public AlertSink {
public:
    explicit JsonFileAlertSink(std::filesystem::path path);

    AlertPostResult PostAlert(const Alert& alert) override;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace reporters
} // namespace auditlens
