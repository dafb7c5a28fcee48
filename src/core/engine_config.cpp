/**
 * @file engine_config.cpp
 * @brief Configuration loading
 *
 * @date 2025
 */

#include "auditlens/core/engine_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace auditlens {
namespace core {

namespace {

template <typename T>
void Read(const json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    }
    catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid configuration value for '") + key +
                                 "': " + e.what());
    }
}

analyzers::DetectionThresholds ReadThresholds(const json& j,
                                              analyzers::DetectionThresholds thresholds) {
    Read(j, "business_hours_start", thresholds.business_hours_start);
    Read(j, "business_hours_end", thresholds.business_hours_end);
    Read(j, "brute_force_failures", thresholds.brute_force_failures);
    Read(j, "brute_force_lookback", thresholds.brute_force_lookback);
    Read(j, "high_activity_events", thresholds.high_activity_events);
    Read(j, "shared_ip_events", thresholds.shared_ip_events);
    Read(j, "shared_ip_users", thresholds.shared_ip_users);

    long long window_minutes = thresholds.brute_force_window.count();
    Read(j, "brute_force_window_minutes", window_minutes);
    thresholds.brute_force_window = std::chrono::minutes(window_minutes);

    return thresholds;
}

const char* GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // anonymous namespace

EngineConfig EngineConfig::FromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    EngineConfig config;
    Read(j, "workers", config.workers);
    Read(j, "fail_orphaned_tasks", config.fail_orphaned_tasks);
    Read(j, "api_base_url", config.api_base_url);
    Read(j, "service_token", config.service_token);

    long long retry_ms = config.dispatch_retry_interval.count();
    Read(j, "dispatch_retry_ms", retry_ms);
    config.dispatch_retry_interval = std::chrono::milliseconds(retry_ms);

    std::string blacklist_directory = config.blacklist_directory.string();
    Read(j, "blacklist_directory", blacklist_directory);
    config.blacklist_directory = blacklist_directory;

    std::string alerts_file = config.alerts_file.string();
    Read(j, "alerts_file", alerts_file);
    config.alerts_file = alerts_file;

    if (j.contains("output_directories")) {
        std::vector<std::string> directories;
        Read(j, "output_directories", directories);
        config.output_directories.assign(directories.begin(), directories.end());
    }

    if (j.contains("thresholds")) {
        if (!j["thresholds"].is_object()) {
            throw std::runtime_error("Configuration key 'thresholds' must be an object");
        }
        config.thresholds = ReadThresholds(j["thresholds"], config.thresholds);
    }

    if (config.workers == 0) {
        throw std::runtime_error("Configuration key 'workers' must be at least 1");
    }
    if (config.dispatch_retry_interval.count() <= 0) {
        throw std::runtime_error("Configuration key 'dispatch_retry_ms' must be positive");
    }

    return config;
}

EngineConfig EngineConfig::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    json document;
    try {
        file >> document;
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed configuration file " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return FromJson(document);
}

void EngineConfig::ApplyEnvironment() {
    if (const char* workers_env = GetEnv("AUDITLENS_MAX_WORKERS")) {
        try {
            const long value = std::stol(workers_env);
            if (value < 1) {
                throw std::out_of_range("must be at least 1");
            }
            workers = static_cast<std::size_t>(value);
        }
        catch (const std::exception& e) {
            spdlog::warn("Ignoring AUDITLENS_MAX_WORKERS='{}': {}", workers_env, e.what());
        }
    }

    if (const char* url = GetEnv("AUDITLENS_API_URL")) {
        api_base_url = url;
    }

    if (const char* token = GetEnv("AUDITLENS_SERVICE_TOKEN")) {
        service_token = token;
    }
}

JobScheduler::Config EngineConfig::SchedulerConfig() const {
    JobScheduler::Config config;
    config.workers = workers;
    config.dispatch_retry_interval = dispatch_retry_interval;
    config.fail_orphaned_tasks = fail_orphaned_tasks;
    return config;
}

} // namespace core
} // namespace auditlens
