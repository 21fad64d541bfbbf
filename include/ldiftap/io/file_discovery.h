/**
 * @file file_discovery.h
 * @brief Locates the LDIF files to extract
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ldiftap {
namespace io {

/**
 * @brief Discovery input
 */
struct DiscoveryOptions {
    std::optional<std::string> filePath;       // Single file
    std::optional<std::string> directoryPath;  // Directory scanned (not recursive)
    std::string filePattern = "*.ldif";        // Glob applied to directory entries
    int maxFileSizeMb = 100;
    bool strict = true;                        // Oversized files raise instead of being skipped
};

/**
 * @brief A file skipped by discovery
 */
struct SkippedFile {
    std::string path;
    std::uintmax_t size = 0;
    std::string reason;
};

/**
 * @brief Discovery output
 */
struct DiscoveryResult {
    std::vector<std::string> files;     // Sorted by path
    std::vector<SkippedFile> skipped;
};

/**
 * @brief File discovery with a maximum-size policy
 *
 * The single file (if set) comes first, followed by the matching files
 * of the directory in path order. Duplicates are removed.
 */
class FileDiscovery {
public:
    explicit FileDiscovery(DiscoveryOptions options);

    /**
     * @throws common::FileException if an input path does not exist, or if a
     *         file exceeds the size limit under the strict policy
     */
    DiscoveryResult discover() const;

    /**
     * @brief Glob match (fnmatch semantics: '*', '?', bracket expressions)
     */
    static bool matchesPattern(const std::string& fileName, const std::string& pattern);

private:
    bool admit(const std::string& path, DiscoveryResult& result) const;

    DiscoveryOptions options_;
};

} // namespace io
} // namespace ldiftap
