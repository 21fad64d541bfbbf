/**
 * @file tap_config.cpp
 * @brief Extractor configuration implementation
 */

#include "ldiftap/config/tap_config.h"
#include "ldiftap/common/exceptions.h"
#include "ldiftap/ldif/line_reader.h"
#include "ldiftap/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>

namespace ldiftap {
namespace config {

namespace {

std::optional<std::string> optionalString(const Json::Value& root, const char* key) {
    const Json::Value& value = root[key];
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isString()) {
        throw common::ConfigException(std::string("'") + key + "' must be a string");
    }
    return value.asString();
}

std::optional<std::vector<std::string>> optionalList(const Json::Value& root, const char* key) {
    const Json::Value& value = root[key];
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isArray()) {
        throw common::ConfigException(std::string("'") + key + "' must be an array of strings");
    }

    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.isString()) {
            throw common::ConfigException(std::string("'") + key + "' must be an array of strings");
        }
        items.push_back(item.asString());
    }
    return items;
}

int integerValue(const Json::Value& root, const char* key, int defaultValue) {
    const Json::Value& value = root[key];
    if (value.isNull()) {
        return defaultValue;
    }
    if (!value.isInt()) {
        throw common::ConfigException(std::string("'") + key + "' must be an integer");
    }
    return value.asInt();
}

bool boolValue(const Json::Value& root, const char* key, bool defaultValue) {
    const Json::Value& value = root[key];
    if (value.isNull()) {
        return defaultValue;
    }
    if (!value.isBool()) {
        throw common::ConfigException(std::string("'") + key + "' must be a boolean");
    }
    return value.asBool();
}

Json::Value listToJson(const std::vector<std::string>& items) {
    Json::Value list(Json::arrayValue);
    for (const auto& item : items) {
        list.append(item);
    }
    return list;
}

// Safe environment variable integer parser with range clamping
int envStoi(const char* name, const char* val, int defaultVal, int minVal, int maxVal) {
    try {
        int v = std::stoi(val);
        return std::clamp(v, minVal, maxVal);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer in {}='{}', using {}", name, val, defaultVal);
        return defaultVal;
    }
}

bool envBool(const char* name, const char* val, bool defaultVal) {
    std::string lowerValue = utils::toLower(utils::trim(val));
    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    }
    if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }
    spdlog::warn("Invalid boolean in {}='{}', using {}", name, val, defaultVal);
    return defaultVal;
}

std::vector<std::string> envList(const char* val) {
    std::vector<std::string> items;
    for (const auto& part : utils::split(val, ',')) {
        std::string item = utils::trim(part);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // anonymous namespace

TapConfig TapConfig::fromJson(const Json::Value& root) {
    if (!root.isObject()) {
        throw common::ConfigException("configuration must be a JSON object");
    }

    TapConfig config;
    config.filePath = optionalString(root, "file_path");
    if (auto pattern = optionalString(root, "file_pattern")) {
        config.filePattern = *pattern;
    }
    config.directoryPath = optionalString(root, "directory_path");

    config.baseDnFilter = optionalString(root, "base_dn_filter");
    config.objectClassFilter = optionalList(root, "object_class_filter");
    config.attributeFilter = optionalList(root, "attribute_filter");
    config.excludeAttributes = optionalList(root, "exclude_attributes");
    if (auto operational = optionalList(root, "operational_attributes")) {
        config.operationalAttributes = *operational;
    }

    if (auto encoding = optionalString(root, "encoding")) {
        config.encoding = *encoding;
    }
    config.batchSize = integerValue(root, "batch_size", config.batchSize);
    config.includeOperationalAttributes =
        boolValue(root, "include_operational_attributes", config.includeOperationalAttributes);
    config.strictParsing = boolValue(root, "strict_parsing", config.strictParsing);
    config.maxFileSizeMb = integerValue(root, "max_file_size_mb", config.maxFileSizeMb);

    if (auto level = optionalString(root, "log_level")) {
        config.logLevel = *level;
    }
    if (auto logFile = optionalString(root, "log_file")) {
        config.logFile = *logFile;
    }

    return config;
}

TapConfig TapConfig::fromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw common::ConfigException("cannot open config file: " + path);
    }

    Json::Value root;
    Json::CharReaderBuilder reader;
    std::string errs;
    if (!Json::parseFromStream(reader, file, &root, &errs)) {
        throw common::ConfigException("invalid JSON in " + path + ": " + errs);
    }

    spdlog::debug("Loaded configuration from {}", path);
    return fromJson(root);
}

void TapConfig::applyEnvironment() {
    if (auto val = std::getenv(ENV_FILE_PATH)) filePath = std::string(val);
    if (auto val = std::getenv(ENV_FILE_PATTERN)) filePattern = val;
    if (auto val = std::getenv(ENV_DIRECTORY_PATH)) directoryPath = std::string(val);

    if (auto val = std::getenv(ENV_BASE_DN_FILTER)) baseDnFilter = std::string(val);
    if (auto val = std::getenv(ENV_OBJECT_CLASS_FILTER)) objectClassFilter = envList(val);
    if (auto val = std::getenv(ENV_ATTRIBUTE_FILTER)) attributeFilter = envList(val);
    if (auto val = std::getenv(ENV_EXCLUDE_ATTRIBUTES)) excludeAttributes = envList(val);

    if (auto val = std::getenv(ENV_ENCODING)) encoding = val;
    if (auto val = std::getenv(ENV_BATCH_SIZE)) {
        batchSize = envStoi(ENV_BATCH_SIZE, val, batchSize, MIN_BATCH_SIZE, MAX_BATCH_SIZE);
    }
    if (auto val = std::getenv(ENV_INCLUDE_OPERATIONAL)) {
        includeOperationalAttributes =
            envBool(ENV_INCLUDE_OPERATIONAL, val, includeOperationalAttributes);
    }
    if (auto val = std::getenv(ENV_STRICT_PARSING)) {
        strictParsing = envBool(ENV_STRICT_PARSING, val, strictParsing);
    }
    if (auto val = std::getenv(ENV_MAX_FILE_SIZE_MB)) {
        maxFileSizeMb = envStoi(ENV_MAX_FILE_SIZE_MB, val, maxFileSizeMb,
                                MIN_FILE_SIZE_MB, MAX_FILE_SIZE_MB);
    }

    if (auto val = std::getenv(ENV_LOG_LEVEL)) logLevel = val;
    if (auto val = std::getenv(ENV_LOG_FILE)) logFile = val;
}

void TapConfig::validate() const {
    bool hasFile = filePath && !filePath->empty();
    bool hasDirectory = directoryPath && !directoryPath->empty();
    if (!hasFile && !hasDirectory) {
        throw common::ConfigException(
            "at least one input source must be specified: file_path or directory_path");
    }
    if (hasDirectory && filePattern.empty()) {
        throw common::ConfigException("file_pattern must not be empty");
    }

    if (batchSize < MIN_BATCH_SIZE) {
        throw common::ConfigException("batch_size must be positive");
    }
    if (batchSize > MAX_BATCH_SIZE) {
        throw common::ConfigException("batch_size cannot exceed " + std::to_string(MAX_BATCH_SIZE));
    }

    if (maxFileSizeMb < MIN_FILE_SIZE_MB) {
        throw common::ConfigException("max_file_size_mb must be positive");
    }
    if (maxFileSizeMb > MAX_FILE_SIZE_MB) {
        throw common::ConfigException("max_file_size_mb cannot exceed " +
                                      std::to_string(MAX_FILE_SIZE_MB) + " MB");
    }

    if (utils::trim(encoding).empty()) {
        throw common::ConfigException("encoding must be specified");
    }
    if (!ldif::parseEncoding(encoding)) {
        throw common::ConfigException("unsupported encoding '" + encoding + "'");
    }

    if (attributeFilter && excludeAttributes) {
        std::set<std::string> included;
        for (const auto& name : *attributeFilter) {
            included.insert(utils::toLower(name));
        }
        std::vector<std::string> overlapping;
        for (const auto& name : *excludeAttributes) {
            if (included.count(utils::toLower(name)) > 0) {
                overlapping.push_back(name);
            }
        }
        if (!overlapping.empty()) {
            std::string joined;
            for (const auto& name : overlapping) {
                joined += (joined.empty() ? "" : ", ") + name;
            }
            throw common::ConfigException("attributes cannot be both included and excluded: " + joined);
        }
    }
}

ldif::FilterConfig TapConfig::filterConfig() const {
    ldif::FilterConfig filter;
    filter.baseDnFilter = baseDnFilter;
    filter.objectClassFilter = objectClassFilter;
    filter.attributeFilter = attributeFilter;
    filter.excludeAttributes = excludeAttributes;
    filter.operationalAttributes = operationalAttributes;
    filter.includeOperationalAttributes = includeOperationalAttributes;
    filter.strictParsing = strictParsing;
    filter.encoding = encoding;
    return filter;
}

Json::Value TapConfig::toJson() const {
    Json::Value root(Json::objectValue);
    root["file_path"] = filePath ? Json::Value(*filePath) : Json::Value(Json::nullValue);
    root["file_pattern"] = filePattern;
    root["directory_path"] = directoryPath ? Json::Value(*directoryPath) : Json::Value(Json::nullValue);
    root["base_dn_filter"] = baseDnFilter ? Json::Value(*baseDnFilter) : Json::Value(Json::nullValue);
    root["object_class_filter"] =
        objectClassFilter ? listToJson(*objectClassFilter) : Json::Value(Json::nullValue);
    root["attribute_filter"] =
        attributeFilter ? listToJson(*attributeFilter) : Json::Value(Json::nullValue);
    root["exclude_attributes"] =
        excludeAttributes ? listToJson(*excludeAttributes) : Json::Value(Json::nullValue);
    root["operational_attributes"] = listToJson(operationalAttributes);
    root["encoding"] = encoding;
    root["batch_size"] = batchSize;
    root["include_operational_attributes"] = includeOperationalAttributes;
    root["strict_parsing"] = strictParsing;
    root["max_file_size_mb"] = maxFileSizeMb;
    root["log_level"] = logLevel;
    root["log_file"] = logFile;
    return root;
}

} // namespace config
} // namespace ldiftap
