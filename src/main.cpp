/**
 * @file main.cpp
 * @brief AuditLens - Command-line interface
 *
 * Entry point of the AuditLens audit log analyzer. Each input (an audit log
 * file or an extraction id) becomes one analysis task on the worker pool;
 * results are written as JSON and a console summary is printed per task.
 *
 * @author AuditLens Development Team
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "auditlens/analyzers/detection_config.hpp"
#include "auditlens/core/audit_task_handler.hpp"
#include "auditlens/core/engine_config.hpp"
#include "auditlens/core/job_scheduler.hpp"
#include "auditlens/core/job_store.hpp"
#include "auditlens/parsers/audit_log_loader.hpp"
#include "auditlens/reporters/alert_sinks.hpp"
#include "auditlens/reporters/json_reporter.hpp"
#include "auditlens/utils/hash_utils.hpp"
#include "auditlens/utils/http_client.hpp"
#include "auditlens/utils/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace auditlens;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/


void PrintBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║      █████╗ ██╗   ██╗██████╗ ██╗████████╗                     ║
║     ██╔══██╗██║   ██║██╔══██╗██║╚══██╔══╝                     ║
║     ███████║██║   ██║██║  ██║██║   ██║     L E N S            ║
║     ██╔══██║██║   ██║██║  ██║██║   ██║                        ║
║     ██║  ██║╚██████╔╝██████╔╝██║   ██║                        ║
║     ╚═╝  ╚═╝ ╚═════╝ ╚═════╝ ╚═╝   ╚═╝                        ║
║                                                               ║
║              Identity Audit Log Threat Analyzer               ║
║                              v1.0.0                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}


std::string PadRight(const std::string& text, std::size_t width) {
    if (text.length() >= width) {
        return text.substr(0, width);
    }
    return text + std::string(width - text.length(), ' ');
}


void PrintConsoleSummary(const std::string& input, const json& result) {
    const json& results = result.at("results");
    const json& summary = results.at("summary");
    const json& statistics = results.at("statistics");

    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                     ANALYSIS SUMMARY                          ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";

    const std::string name = utils::StringUtils::Truncate(input, 50);
    std::cout << "║  Input: " << PadRight(name, 55) << "║\n";

    std::cout << "║  Events: "
              << PadRight(std::to_string(statistics.value("totalEvents", 0)), 54) << "║\n";
    std::cout << "║  Findings: "
              << PadRight(std::to_string(summary.value("totalFindings", 0)) + " (" +
                          std::to_string(summary.value("criticalFindings", 0)) + " critical, " +
                          std::to_string(summary.value("highSeverityFindings", 0)) + " high)", 52)
              << "║\n";

    const int risk = summary.value("riskScore", 0);
    const std::string risk_status = risk >= 75 ? "[CRITICAL]" :
                                    risk >= 50 ? "[HIGH]" :
                                    risk >= 25 ? "[MEDIUM]" : "[LOW]";
    std::cout << "║  Risk score: "
              << PadRight(std::to_string(risk) + " / 100 " + risk_status, 50) << "║\n";

    for (const auto& threat : summary.value("topThreats", json::array())) {
        std::cout << "║    - "
                  << PadRight(threat.value("type", "") + " x" +
                              std::to_string(threat.value("count", 0)), 58)
                  << "║\n";
    }

    std::cout << "║  Alerts: "
              << PadRight(std::to_string(result.value("alerts", json::array()).size()), 54)
              << "║\n";

    const auto& quality = statistics.value("dataQuality", json::object());
    const std::size_t unknown = quality.value("totalUnknownUsers", 0);
    if (unknown > 0) {
        std::cout << "║  Unknown users: " << PadRight(std::to_string(unknown), 47) << "║\n";
    }

    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";
}

/*******************************************************************************
 * Task Construction
 ******************************************************************************/

struct SubmittedInput {
    std::string input;
    std::string task_id;
};


std::optional<core::Task> BuildTask(const std::string& input, std::size_t index,
                                    core::TaskPriority priority) {
    core::Task task;
    task.kind = core::TaskKind::ANALYSIS;
    task.priority = priority;
    task.id = "analysis-" + std::to_string(index + 1) + "-" +
              utils::HashUtils::SHA256Prefix(input, 8);

    std::error_code ec;
    if (std::filesystem::is_regular_file(input, ec)) {
        try {
            auto records = parsers::AuditLogLoader::LoadFile(input);
            task.payload["events"] = records;
            task.payload["extractionId"] = std::filesystem::path(input).stem().string();
        }
        catch (const std::exception& e) {
            spdlog::error("[ERROR] Cannot load {}: {}", input, e.what());
            return std::nullopt;
        }
    } else {
        task.payload["extractionId"] = input;
    }

    task.payload["analysisId"] = task.id;
    return task;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    PrintBanner();

    // Configure CLI parser
    CLI::App app{"AuditLens Audit Log Analyzer"};
    app.footer("\nEach input is an audit log file (.json/.csv) or an extraction id.");

    std::vector<std::string> inputs;
    std::string config_path;
    std::string blacklist_dir;
    std::string output_dir = "./results";
    std::string alerts_file;
    std::string priority_name = "medium";
    std::size_t workers = 0;
    bool verbose = false;

    app.add_option("inputs", inputs, "Audit log files or extraction ids")
        ->required();
    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("-b,--blacklists", blacklist_dir, "Directory of *-Blacklist.csv files");
    app.add_option("-w,--workers", workers, "Worker pool size")
        ->check(CLI::PositiveNumber);
    app.add_option("-p,--priority", priority_name, "Task priority")
        ->check(CLI::IsMember({"critical", "high", "medium", "low"}))
        ->default_val("medium");
    app.add_option("-o,--output", output_dir, "Output directory for results")
        ->default_val("./results");
    app.add_option("--alerts-file", alerts_file, "Append alerts to this JSON-lines file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    utils::HttpClient::GlobalInit();
    int exit_code = 0;

    try {
        // Resolve configuration: file, environment, command line
        core::EngineConfig config = config_path.empty()
            ? core::EngineConfig{}
            : core::EngineConfig::LoadFromFile(config_path);
        config.ApplyEnvironment();

        if (!blacklist_dir.empty()) {
            config.blacklist_directory = blacklist_dir;
        }
        if (workers > 0) {
            config.workers = workers;
        }
        if (!alerts_file.empty()) {
            config.alerts_file = alerts_file;
        }

        const core::TaskPriority priority =
            core::ParseTaskPriority(priority_name).value_or(core::TaskPriority::MEDIUM);

        // Shared collaborators
        spdlog::info("[INIT] Loading detection configuration...");
        auto detection = analyzers::DetectionConfig::LoadFromDirectory(
            config.blacklist_directory, config.thresholds);

        std::vector<std::shared_ptr<parsers::AuditDataSource>> sources;
        if (!config.api_base_url.empty()) {
            parsers::UploadedDataSource::Config upload_config;
            upload_config.api_base_url = config.api_base_url;
            upload_config.service_token = config.service_token;
            sources.push_back(std::make_shared<parsers::UploadedDataSource>(upload_config));
        }
        parsers::DiskAuditDataSource::Config disk_config;
        disk_config.candidate_directories = config.output_directories;
        sources.push_back(std::make_shared<parsers::DiskAuditDataSource>(disk_config));
        auto data_source = std::make_shared<parsers::ChainedDataSource>(std::move(sources));

        std::shared_ptr<reporters::AlertSink> alert_sink;
        if (!config.alerts_file.empty()) {
            alert_sink = std::make_shared<reporters::JsonFileAlertSink>(config.alerts_file);
        } else if (!config.api_base_url.empty()) {
            reporters::HttpAlertSink::Config alert_config;
            alert_config.api_base_url = config.api_base_url;
            alert_config.service_token = config.service_token;
            alert_sink = std::make_shared<reporters::HttpAlertSink>(alert_config);
        }

        // Worker pool
        auto store = std::make_shared<core::InMemoryJobStore>();
        core::JobScheduler scheduler(
            config.SchedulerConfig(),
            [detection, data_source, alert_sink](std::size_t) {
                return std::make_unique<core::AuditTaskHandler>(detection, data_source,
                                                                alert_sink);
            },
            store);

        if (!scheduler.Initialize()) {
            spdlog::error("[ERROR] Failed to initialize job scheduler");
            utils::HttpClient::GlobalCleanup();
            return 1;
        }

        // Submit one analysis task per input
        std::vector<SubmittedInput> submitted;
        for (std::size_t i = 0; i < inputs.size(); ++i) {
            auto task = BuildTask(inputs[i], i, priority);
            if (!task) {
                exit_code = 1;
                continue;
            }

            if (!store->Create(*task)) {
                spdlog::error("[ERROR] Duplicate task id {}", task->id);
                exit_code = 1;
                continue;
            }
            submitted.push_back({inputs[i], task->id});
            scheduler.Submit(std::move(*task));
            spdlog::info("[START] Queued {} as {}", inputs[i], submitted.back().task_id);
        }

        std::vector<std::string> task_ids;
        for (const auto& entry : submitted) {
            task_ids.push_back(entry.task_id);
        }

        while (!store->WaitForTerminal(task_ids, std::chrono::seconds(5))) {
            auto status = scheduler.GetStatus();
            spdlog::info("[WAIT] {} running, {} queued", status.active_workers,
                         status.queue_length);

            // Orphaned tasks never reach a terminal state
            const bool only_orphans_left = std::all_of(task_ids.begin(), task_ids.end(),
                [&](const std::string& id) {
                    auto record = store->Get(id);
                    if (record && (record->state == core::JobState::COMPLETED ||
                                   record->state == core::JobState::FAILED)) {
                        return true;
                    }
                    return std::find(status.orphaned_task_ids.begin(),
                                     status.orphaned_task_ids.end(),
                                     id) != status.orphaned_task_ids.end();
                });
            if (only_orphans_left) {
                spdlog::warn("[WAIT] Remaining tasks were orphaned by crashed workers");
                break;
            }
        }

        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        spdlog::info("[DONE] All tasks finished");

        // Reports
        reporters::JsonReporterConfig reporter_config;
        reporter_config.output_directory = output_dir;
        reporters::JsonReporter reporter(reporter_config);

        for (const auto& entry : submitted) {
            auto record = store->Get(entry.task_id);
            if (!record || record->state != core::JobState::COMPLETED) {
                const std::string message = (record && record->error)
                    ? record->error->message : "unknown error";
                spdlog::error("[FAIL] {} ({}): {}", entry.input, entry.task_id, message);
                exit_code = 1;
                continue;
            }

            auto json_path = reporter.GenerateReport(entry.task_id, record->result);
            if (!json_path.empty()) {
                spdlog::info("[REPORT] JSON results saved: {}", json_path.string());
            } else {
                spdlog::warn("[WARN] Failed to write results for {}", entry.task_id);
                exit_code = 1;
            }

            PrintConsoleSummary(entry.input, record->result);
        }

        scheduler.Shutdown();

    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        exit_code = 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        exit_code = 1;
    }

    utils::HttpClient::GlobalCleanup();
    return exit_code;
}
