/**
 * @file audit_log_loader.cpp
 * @brief Implementation of audit record loading
 *
 * @date 2025
 */

#include "auditlens/parsers/audit_log_loader.hpp"
#include "auditlens/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace auditlens {
namespace parsers {

namespace {

using utils::StringUtils;

const std::string kNoDataMessage =
    "No extraction data found. Please ensure the extraction completed successfully "
    "and data is available.";

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

/**
 * @brief Split CSV text into records, joining lines inside quoted fields
 */
std::vector<std::string> SplitCsvRecords(const std::string& content) {
    std::vector<std::string> records;
    std::istringstream stream(content);
    std::string line;
    std::string pending;
    bool in_quotes = false;

    while (std::getline(stream, line)) {
        if (in_quotes) {
            pending += '\n';
        }
        pending += line;

        for (char c : line) {
            if (c == '"') {
                in_quotes = !in_quotes;
            }
        }

        if (!in_quotes) {
            records.push_back(std::move(pending));
            pending.clear();
        }
    }

    if (!pending.empty()) {
        records.push_back(std::move(pending));
    }
    return records;
}

bool IsSafeExtractionId(const std::string& id) {
    return !id.empty() && id != "." && id != ".." &&
           id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

} // anonymous namespace

// ============================================================================
// AuditLogLoader

bool AuditLogLoader::IsDataFile(const std::filesystem::path& path) {
    const std::string ext = StringUtils::ToLower(path.extension().string());
    return ext == ".json" || ext == ".csv";
}

std::vector<json> AuditLogLoader::LoadFile(const std::filesystem::path& path) {
    const std::string ext = StringUtils::ToLower(path.extension().string());
    if (ext != ".json" && ext != ".csv") {
        throw std::runtime_error("Unsupported audit log format: " + path.string());
    }

    const std::string content = StringUtils::StripBom(ReadFile(path));

    auto records = ext == ".json" ? ParseJson(content) : ParseCsv(content);
    spdlog::info("Loaded {} records from {}", records.size(), path.filename().string());
    return records;
}

std::vector<json> AuditLogLoader::ParseJson(const std::string& content) {
    json document;
    try {
        document = json::parse(content);
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed JSON audit log: ") + e.what());
    }

    std::vector<json> records;
    if (document.is_array()) {
        records.reserve(document.size());
        for (auto& record : document) {
            records.push_back(std::move(record));
        }
    } else {
        records.push_back(std::move(document));
    }
    return records;
}

std::vector<json> AuditLogLoader::ParseCsv(const std::string& content) {
    std::vector<json> records;
    auto lines = SplitCsvRecords(content);

    auto it = std::find_if(lines.begin(), lines.end(), [](const std::string& line) {
        return !StringUtils::Trim(line).empty();
    });
    if (it == lines.end()) {
        return records;
    }

    std::vector<std::string> header = StringUtils::ParseCsvLine(*it);
    for (auto& column : header) {
        column = StringUtils::Trim(column);
    }

    for (++it; it != lines.end(); ++it) {
        if (StringUtils::Trim(*it).empty()) {
            continue;
        }

        auto cells = StringUtils::ParseCsvLine(*it);
        json record = json::object();
        const std::size_t count = std::min(header.size(), cells.size());
        for (std::size_t i = 0; i < count; ++i) {
            if (!header[i].empty()) {
                record[header[i]] = cells[i];
            }
        }
        records.push_back(std::move(record));
    }
    return records;
}

// ============================================================================
// UploadedDataSource

UploadedDataSource::UploadedDataSource(const Config& config)
    : config_(config)
    , client_([&config]() {
          utils::HttpClient::Config client_config;
          client_config.timeout = config.timeout;
          return client_config;
      }()) {
}

std::vector<json> UploadedDataSource::Fetch(const std::string& extraction_id) {
    const std::string url = config_.api_base_url + "/api/upload/data/" + extraction_id;

    utils::HttpResponse response = client_.Get(url, {"x-service-token: " + config_.service_token});
    if (!response.Ok()) {
        throw NoDataFoundError("Upload store returned HTTP " +
                               std::to_string(response.status_code) + " for " + extraction_id);
    }

    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.value("success", false)) {
        throw NoDataFoundError("Upload store has no data for " + extraction_id);
    }

    std::vector<json> records;
    auto data = body.find("data");
    if (data != body.end() && data->is_array()) {
        records.assign(data->begin(), data->end());
    }

    spdlog::info("Fetched {} uploaded records for {}", records.size(), extraction_id);
    return records;
}

// ============================================================================
// DiskAuditDataSource

DiskAuditDataSource::DiskAuditDataSource(const Config& config)
    : config_(config) {
}

DiskAuditDataSource::DiskAuditDataSource()
    : DiskAuditDataSource(Config{}) {
}

std::vector<json> DiskAuditDataSource::Fetch(const std::string& extraction_id) {
    if (!IsSafeExtractionId(extraction_id)) {
        throw NoDataFoundError("Invalid extraction id: " + extraction_id);
    }

    for (const auto& base : config_.candidate_directories) {
        const std::filesystem::path directory = base / extraction_id;
        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec)) {
            spdlog::debug("Path does not exist: {}", directory.string());
            continue;
        }

        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
            if (entry.is_regular_file() && AuditLogLoader::IsDataFile(entry.path())) {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        spdlog::debug("Found {} data file(s) in {}", files.size(), directory.string());

        std::vector<json> records;
        bool data_found = false;
        for (const auto& file : files) {
            try {
                auto loaded = AuditLogLoader::LoadFile(file);
                records.insert(records.end(),
                               std::make_move_iterator(loaded.begin()),
                               std::make_move_iterator(loaded.end()));
                data_found = true;
            }
            catch (const std::exception& e) {
                spdlog::error("Error reading file {}: {}", file.string(), e.what());
            }
        }

        if (data_found) {
            spdlog::info("Loaded {} records from {}", records.size(), directory.string());
            return records;
        }
    }

    throw NoDataFoundError(kNoDataMessage);
}

// ============================================================================
// ChainedDataSource

ChainedDataSource::ChainedDataSource(std::vector<std::shared_ptr<AuditDataSource>> sources)
    : sources_(std::move(sources)) {
}

std::vector<json> ChainedDataSource::Fetch(const std::string& extraction_id) {
    std::string last_error = kNoDataMessage;

    for (const auto& source : sources_) {
        try {
            return source->Fetch(extraction_id);
        }
        catch (const std::exception& e) {
            spdlog::info("No data from {} for {}: {}", source->Name(), extraction_id, e.what());
            last_error = e.what();
        }
    }

    throw NoDataFoundError(last_error);
}

} // namespace parsers
} // namespace auditlens
