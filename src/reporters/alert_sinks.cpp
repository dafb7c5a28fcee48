/**
 * @file alert_sinks.cpp
 * @brief Alert API client and JSON-lines alert file
 *
 * @date 2025
 */

#include "auditlens/reporters/alert_sinks.hpp"
#include "auditlens/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

using json = nlohmann::json;

namespace auditlens {
namespace reporters {

namespace {

utils::HttpClient::Config MakeClientConfig(const HttpAlertSink::Config& config) {
    utils::HttpClient::Config client_config;
    client_config.timeout = config.timeout;
    return client_config;
}

} // anonymous namespace

// ============================================================================
// HttpAlertSink

HttpAlertSink::HttpAlertSink(const Config& config)
    : config_(config)
    , client_(MakeClientConfig(config)) {
}

AlertPostResult HttpAlertSink::PostAlert(const Alert& alert) {
    const std::string url = config_.api_base_url + "/api/alerts";

    utils::HttpResponse response;
    try {
        response = client_.PostJson(url, alert.ToJson().dump(),
                                    {"x-service-token: " + config_.service_token});
    }
    catch (const std::exception& e) {
        throw AlertDeliveryError(e.what());
    }

    if (!response.Ok()) {
        throw AlertDeliveryError("Alert API returned HTTP " + std::to_string(response.status_code));
    }

    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw AlertDeliveryError("Alert API returned a malformed response");
    }

    AlertPostResult result;
    result.success = body.value("success", false);
    if (body.contains("alert")) {
        result.alert = body["alert"];
    }
    return result;
}

// ============================================================================
// JsonFileAlertSink

JsonFileAlertSink::JsonFileAlertSink(std::filesystem::path path)
    : path_(std::move(path)) {
}

AlertPostResult JsonFileAlertSink::PostAlert(const Alert& alert) {
    json document = alert.ToJson();
    const std::string line = document.dump(-1, ' ', false, json::error_handler_t::replace);
    document["id"] = "alert_" + utils::HashUtils::SHA256(line).substr(0, 16);

    std::lock_guard<std::mutex> lock(mutex_);

    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }

    std::ofstream file(path_, std::ios::app);
    if (!file) {
        throw AlertDeliveryError("Cannot open alert file: " + path_.string());
    }
    file << document.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    if (!file) {
        throw AlertDeliveryError("Failed to write alert file: " + path_.string());
    }

    AlertPostResult result;
    result.success = true;
    result.alert = std::move(document);
    return result;
}

} // namespace reporters
} // namespace auditlens
