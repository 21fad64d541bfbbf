/**
 * @file tap_config.h
 * @brief Extractor configuration
 *
 * Loaded from a JSON file (snake_case keys), then overridden from
 * LDIF_TAP_* environment variables, then from the command line.
 */

#pragma once

#include "ldiftap/ldif/entry_filter.h"
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace ldiftap {
namespace config {

struct TapConfig {
    // Input
    std::optional<std::string> filePath;
    std::string filePattern = "*.ldif";
    std::optional<std::string> directoryPath;

    // Filtering
    std::optional<std::string> baseDnFilter;
    std::optional<std::vector<std::string>> objectClassFilter;
    std::optional<std::vector<std::string>> attributeFilter;
    std::optional<std::vector<std::string>> excludeAttributes;
    std::vector<std::string> operationalAttributes = ldif::defaultOperationalAttributes();

    // Processing
    std::string encoding = "utf-8";
    int batchSize = 1000;
    bool includeOperationalAttributes = false;
    bool strictParsing = true;
    int maxFileSizeMb = 100;

    // Logging
    std::string logLevel = "info";
    std::string logFile;

    static constexpr int MIN_BATCH_SIZE = 1;
    static constexpr int MAX_BATCH_SIZE = 10000;
    static constexpr int MIN_FILE_SIZE_MB = 1;
    static constexpr int MAX_FILE_SIZE_MB = 1000;

    /**
     * @brief Build from a parsed JSON object
     * @throws common::ConfigException on wrong value types
     */
    static TapConfig fromJson(const Json::Value& root);

    /**
     * @brief Load a JSON config file
     * @throws common::ConfigException if the file is missing or malformed
     */
    static TapConfig fromJsonFile(const std::string& path);

    /**
     * @brief Apply LDIF_TAP_* environment overrides
     *
     * List values are comma-separated; integer values are clamped to
     * their valid range.
     */
    void applyEnvironment();

    /**
     * @brief Check business rules
     * @throws common::ConfigException on the first violation
     */
    void validate() const;

    /**
     * @brief Settings consumed by the parser
     */
    ldif::FilterConfig filterConfig() const;

    /**
     * @brief Config as JSON (same keys as fromJson)
     */
    Json::Value toJson() const;

    static constexpr const char* ENV_FILE_PATH = "LDIF_TAP_FILE_PATH";
    static constexpr const char* ENV_FILE_PATTERN = "LDIF_TAP_FILE_PATTERN";
    static constexpr const char* ENV_DIRECTORY_PATH = "LDIF_TAP_DIRECTORY_PATH";
    static constexpr const char* ENV_BASE_DN_FILTER = "LDIF_TAP_BASE_DN_FILTER";
    static constexpr const char* ENV_OBJECT_CLASS_FILTER = "LDIF_TAP_OBJECT_CLASS_FILTER";
    static constexpr const char* ENV_ATTRIBUTE_FILTER = "LDIF_TAP_ATTRIBUTE_FILTER";
    static constexpr const char* ENV_EXCLUDE_ATTRIBUTES = "LDIF_TAP_EXCLUDE_ATTRIBUTES";
    static constexpr const char* ENV_ENCODING = "LDIF_TAP_ENCODING";
    static constexpr const char* ENV_BATCH_SIZE = "LDIF_TAP_BATCH_SIZE";
    static constexpr const char* ENV_INCLUDE_OPERATIONAL = "LDIF_TAP_INCLUDE_OPERATIONAL_ATTRIBUTES";
    static constexpr const char* ENV_STRICT_PARSING = "LDIF_TAP_STRICT_PARSING";
    static constexpr const char* ENV_MAX_FILE_SIZE_MB = "LDIF_TAP_MAX_FILE_SIZE_MB";
    static constexpr const char* ENV_LOG_LEVEL = "LDIF_TAP_LOG_LEVEL";
    static constexpr const char* ENV_LOG_FILE = "LDIF_TAP_LOG_FILE";
};

} // namespace config
} // namespace ldiftap
