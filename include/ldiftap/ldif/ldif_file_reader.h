/**
 * @file ldif_file_reader.h
 * @brief LDIF parser bound to an open file
 */

#pragma once

#include "ldiftap/ldif/entry_filter.h"
#include "ldiftap/ldif/ldif_entry.h"
#include "ldiftap/ldif/ldif_parser.h"
#include "ldiftap/ldif/line_reader.h"
#include <fstream>
#include <memory>
#include <optional>
#include <string>

namespace ldiftap {
namespace ldif {

/**
 * @brief Owns the file handle for one parse of one LDIF file
 *
 * The file is scanned for encoding errors before the first entry is
 * produced, so a file that cannot be decoded yields no entries at all.
 * The handle is closed when the reader is exhausted or destroyed, which
 * covers consumers that stop iterating early.
 *
 * Usage:
 * @code
 * LdifFileReader reader("users.ldif", filterConfig);
 * while (auto entry = reader.next()) {
 *     sink.write(entry->toJson());
 * }
 * @endcode
 */
class LdifFileReader {
public:
    /**
     * @brief Open the file and check its encoding
     *
     * @throws common::ConfigException if the configured encoding is unsupported
     * @throws common::FileException if the file cannot be opened
     * @throws common::DecodeException if the file is not valid in the encoding
     *         and strict parsing is enabled
     */
    LdifFileReader(const std::string& filePath, const FilterConfig& config);

    LdifFileReader(const LdifFileReader&) = delete;
    LdifFileReader& operator=(const LdifFileReader&) = delete;

    /**
     * @brief Next accepted entry, std::nullopt when the file is done
     *
     * @throws common::ParseException under strict parsing
     */
    std::optional<LdifEntry> next();

    /**
     * @brief True when the file was abandoned for an encoding error (lenient mode)
     */
    bool abandoned() const { return abandoned_; }

    bool isOpen() const { return file_.is_open(); }

    const std::string& filePath() const { return filePath_; }

    /**
     * @brief Parser counters, empty if the file was abandoned
     */
    ParserStats stats() const;

private:
    void close();

    std::string filePath_;
    std::ifstream file_;
    std::unique_ptr<LineReader> lineReader_;
    std::unique_ptr<LdifParser> parser_;
    bool abandoned_ = false;
};

} // namespace ldif
} // namespace ldiftap
