/**
 * @file file_discovery.cpp
 * @brief File discovery implementation
 */

#include "ldiftap/io/file_discovery.h"
#include "ldiftap/common/exceptions.h"
#include <spdlog/spdlog.h>
#include <fnmatch.h>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace ldiftap {
namespace io {

FileDiscovery::FileDiscovery(DiscoveryOptions options)
    : options_(std::move(options)) {}

DiscoveryResult FileDiscovery::discover() const {
    DiscoveryResult result;

    if (options_.filePath && !options_.filePath->empty()) {
        std::error_code ec;
        if (!fs::is_regular_file(*options_.filePath, ec)) {
            throw common::FileException(*options_.filePath, "not a regular file");
        }
        admit(*options_.filePath, result);
    }

    if (options_.directoryPath && !options_.directoryPath->empty()) {
        const std::string& dir = *options_.directoryPath;
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            throw common::FileException(dir, "not a directory");
        }

        std::vector<std::string> matches;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            throw common::FileException(dir, ec.message());
        }
        for (const auto& entry : it) {
            std::error_code statEc;
            if (!entry.is_regular_file(statEc)) {
                continue;
            }
            if (matchesPattern(entry.path().filename().string(), options_.filePattern)) {
                matches.push_back(entry.path().string());
            }
        }
        std::sort(matches.begin(), matches.end());

        for (const auto& path : matches) {
            if (std::find(result.files.begin(), result.files.end(), path) != result.files.end()) {
                continue;
            }
            admit(path, result);
        }
    }

    spdlog::info("Discovered {} LDIF file(s), {} skipped", result.files.size(), result.skipped.size());
    return result;
}

bool FileDiscovery::matchesPattern(const std::string& fileName, const std::string& pattern) {
    return ::fnmatch(pattern.c_str(), fileName.c_str(), 0) == 0;
}

bool FileDiscovery::admit(const std::string& path, DiscoveryResult& result) const {
    std::error_code ec;
    std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw common::FileException(path, ec.message());
    }

    const std::uintmax_t limit =
        static_cast<std::uintmax_t>(options_.maxFileSizeMb) * 1024 * 1024;
    if (size > limit) {
        std::string reason = "file size " + std::to_string(size) + " bytes exceeds " +
                             std::to_string(options_.maxFileSizeMb) + " MB";
        if (options_.strict) {
            throw common::FileException(path, reason);
        }
        spdlog::warn("Skipping {}: {}", path, reason);
        result.skipped.push_back({path, size, reason});
        return false;
    }

    result.files.push_back(path);
    return true;
}

} // namespace io
} // namespace ldiftap
