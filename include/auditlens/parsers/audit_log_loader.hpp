/**
 * @file audit_log_loader.hpp
 * @brief Raw audit record loading: files, uploaded-data store, extractor output
 *
 * Raw records are kept as JSON documents. JSON files hold either an array of
 * records or a single record; CSV files carry a header row and every data row
 * becomes an object of string values keyed by column name.
 *
 * **Data sources**:
 * - UploadedDataSource: `GET {api}/api/upload/data/{id}` on the API service
 * - DiskAuditDataSource: first candidate directory `<base>/{id}` holding
 *   `.json` / `.csv` files
 * - ChainedDataSource: first source that yields data wins
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "auditlens/utils/http_client.hpp"

namespace auditlens {
namespace parsers {

/**
 * @class NoDataFoundError
 * @brief No data source produced records for an extraction
 */
class NoDataFoundError : public std::runtime_error {
public:
    explicit NoDataFoundError(const std::string& message)
        : std::runtime_error(message) {
    }
};

/**
 * @class AuditLogLoader
 * @brief Parses audit log files into raw JSON records
 */
class AuditLogLoader {
public:
    /**
     * @brief Load a `.json` or `.csv` file
     * @throws std::runtime_error if the file cannot be read, has another
     *         extension, or is malformed
     */
    static std::vector<nlohmann::json> LoadFile(const std::filesystem::path& path);

    /**
     * @brief Parse JSON text: an array of records or one record
     */
    static std::vector<nlohmann::json> ParseJson(const std::string& content);

    /**
     * @brief Parse CSV text with a header row
     *
     * Quoted fields may span lines. Rows with fewer cells than the header
     * leave the missing columns out; surplus cells are ignored.
     */
    static std::vector<nlohmann::json> ParseCsv(const std::string& content);

    /// `.json` or `.csv` (case-insensitive)
    static bool IsDataFile(const std::filesystem::path& path);
};

/**
 * @class AuditDataSource
 * @brief Data-fetch collaborator of the analysis task
 */
class AuditDataSource {
public:
    virtual ~AuditDataSource() = default;

    /**
     * @brief Fetch the raw records of an extraction, in source order
     * @throws NoDataFoundError if the source has no data for the id
     */
    virtual std::vector<nlohmann::json> Fetch(const std::string& extraction_id) = 0;

    virtual std::string Name() const = 0;
};

/**
 * @class UploadedDataSource
 * @brief Client of the uploaded-data store
 *
 * Expects `{ "success": true, "data": [ ... ] }`.
 */
class UploadedDataSource : public AuditDataSource {
public:
    struct Config {
        std::string api_base_url{"http://api:3000"};
        std::string service_token;                  ///< Sent as `x-service-token`
        std::chrono::seconds timeout{30};
    };

    explicit UploadedDataSource(const Config& config);

    std::vector<nlohmann::json> Fetch(const std::string& extraction_id) override;
    std::string Name() const override { return "upload-store"; }

private:
    Config config_;
    utils::HttpClient client_;
};

/**
 * @class DiskAuditDataSource
 * @brief Reads extractor output files from disk
 *
 * Files of one directory are read in name order and concatenated. A file
 * that fails to parse is logged and skipped.
 */
class DiskAuditDataSource : public AuditDataSource {
public:
    struct Config {
        std::vector<std::filesystem::path> candidate_directories{
            "/output", "/extractor_output", "/app/output", "/shared/output"
        };
    };

    explicit DiskAuditDataSource(const Config& config);
    explicit DiskAuditDataSource();

    std::vector<nlohmann::json> Fetch(const std::string& extraction_id) override;
    std::string Name() const override { return "extractor-output"; }

private:
    Config config_;
};

/**
 * @class ChainedDataSource
 * @brief Tries each source in order; the first that yields data wins
 */
class ChainedDataSource : public AuditDataSource {
public:
    explicit ChainedDataSource(std::vector<std::shared_ptr<AuditDataSource>> sources);

    std::vector<nlohmann::json> Fetch(const std::string& extraction_id) override;
    std::string Name() const override { return "chain"; }

private:
    std::vector<std::shared_ptr<AuditDataSource>> sources_;
};

} // namespace parsers
} // namespace auditlens
