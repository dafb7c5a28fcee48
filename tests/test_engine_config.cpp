#include <gtest/gtest.h>
#include "auditlens/core/engine_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace auditlens::core;
using json = nlohmann::json;

TEST(EngineConfigTest, Defaults) {
    EngineConfig config = EngineConfig::FromJson(json::object());

    EXPECT_GE(config.workers, 1u);
    EXPECT_EQ(config.dispatch_retry_interval, std::chrono::milliseconds(1000));
    EXPECT_TRUE(config.fail_orphaned_tasks);
    EXPECT_EQ(config.blacklist_directory.string(), "config/blacklists");
    EXPECT_EQ(config.output_directories.size(), 4u);
    EXPECT_TRUE(config.api_base_url.empty());
}

TEST(EngineConfigTest, ReadsAllSections) {
    json j = {
        {"workers", 3},
        {"dispatch_retry_ms", 250},
        {"fail_orphaned_tasks", false},
        {"blacklist_directory", "/etc/auditlens/blacklists"},
        {"alerts_file", "/var/log/auditlens/alerts.jsonl"},
        {"output_directories", {"/data/a", "/data/b"}},
        {"api_base_url", "http://localhost:3000"},
        {"thresholds", {
            {"business_hours_start", 7},
            {"brute_force_failures", 5},
            {"brute_force_window_minutes", 30},
            {"shared_ip_users", 20}
        }}
    };

    EngineConfig config = EngineConfig::FromJson(j);

    EXPECT_EQ(config.workers, 3u);
    EXPECT_EQ(config.dispatch_retry_interval, std::chrono::milliseconds(250));
    EXPECT_FALSE(config.fail_orphaned_tasks);
    EXPECT_EQ(config.alerts_file.string(), "/var/log/auditlens/alerts.jsonl");
    ASSERT_EQ(config.output_directories.size(), 2u);
    EXPECT_EQ(config.output_directories[1].string(), "/data/b");
    EXPECT_EQ(config.thresholds.business_hours_start, 7);
    EXPECT_EQ(config.thresholds.business_hours_end, 22);
    EXPECT_EQ(config.thresholds.brute_force_failures, 5u);
    EXPECT_EQ(config.thresholds.brute_force_window, std::chrono::minutes(30));
    EXPECT_EQ(config.thresholds.shared_ip_users, 20u);

    JobScheduler::Config scheduler = config.SchedulerConfig();
    EXPECT_EQ(scheduler.workers, 3u);
    EXPECT_FALSE(scheduler.fail_orphaned_tasks);
}

TEST(EngineConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(EngineConfig::FromJson(json::array()), std::runtime_error);
    EXPECT_THROW(EngineConfig::FromJson({{"workers", 0}}), std::runtime_error);
    EXPECT_THROW(EngineConfig::FromJson({{"workers", "many"}}), std::runtime_error);
    EXPECT_THROW(EngineConfig::FromJson({{"dispatch_retry_ms", 0}}), std::runtime_error);
    EXPECT_THROW(EngineConfig::FromJson({{"thresholds", 5}}), std::runtime_error);
}

TEST(EngineConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "auditlens_engine_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"workers": 2, "service_token": "secret"})";
    }

    EngineConfig config = EngineConfig::LoadFromFile(path);
    EXPECT_EQ(config.workers, 2u);
    EXPECT_EQ(config.service_token, "secret");

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(EngineConfig::LoadFromFile(path), std::runtime_error);

    std::filesystem::remove(path);
    EXPECT_THROW(EngineConfig::LoadFromFile(path), std::runtime_error);
}

TEST(EngineConfigTest, EnvironmentOverrides) {
    setenv("AUDITLENS_MAX_WORKERS", "6", 1);
    setenv("AUDITLENS_API_URL", "http://api.internal:3000", 1);
    setenv("AUDITLENS_SERVICE_TOKEN", "env-token", 1);

    EngineConfig config;
    config.ApplyEnvironment();

    EXPECT_EQ(config.workers, 6u);
    EXPECT_EQ(config.api_base_url, "http://api.internal:3000");
    EXPECT_EQ(config.service_token, "env-token");

    setenv("AUDITLENS_MAX_WORKERS", "zero", 1);
    config.ApplyEnvironment();
    EXPECT_EQ(config.workers, 6u);

    unsetenv("AUDITLENS_MAX_WORKERS");
    unsetenv("AUDITLENS_API_URL");
    unsetenv("AUDITLENS_SERVICE_TOKEN");
}
