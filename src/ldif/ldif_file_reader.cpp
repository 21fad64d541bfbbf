/**
 * @file ldif_file_reader.cpp
 * @brief LDIF file reader implementation
 */

#include "ldiftap/ldif/ldif_file_reader.h"
#include "ldiftap/common/exceptions.h"
#include <spdlog/spdlog.h>

namespace ldiftap {
namespace ldif {

LdifFileReader::LdifFileReader(const std::string& filePath, const FilterConfig& config)
    : filePath_(filePath) {
    auto encoding = parseEncoding(config.encoding);
    if (!encoding) {
        throw common::ConfigException("unsupported encoding '" + config.encoding + "'");
    }

    file_.open(filePath, std::ios::in | std::ios::binary);
    if (!file_.is_open()) {
        throw common::FileException(filePath, "cannot open file");
    }

    // Decode check before any entry is produced
    auto invalidLine = LineReader::findInvalidLine(file_, *encoding);
    if (invalidLine) {
        close();
        if (config.strictParsing) {
            throw common::DecodeException(filePath, *invalidLine, encodingToString(*encoding));
        }
        spdlog::warn("Skipping {}: line {} is not valid {}",
                     filePath, *invalidLine, encodingToString(*encoding));
        abandoned_ = true;
        return;
    }

    file_.clear();
    file_.seekg(0, std::ios::beg);
    if (!file_) {
        close();
        throw common::FileException(filePath, "cannot rewind file");
    }

    lineReader_ = std::make_unique<LineReader>(file_, *encoding, filePath);
    parser_ = std::make_unique<LdifParser>(*lineReader_, config, filePath);
}

std::optional<LdifEntry> LdifFileReader::next() {
    if (!parser_ || !file_.is_open()) {
        return std::nullopt;
    }

    std::optional<LdifEntry> entry;
    try {
        entry = parser_->next();
    } catch (const common::LdifTapException&) {
        close();
        throw;
    }

    if (!entry) {
        close();
    }
    return entry;
}

ParserStats LdifFileReader::stats() const {
    return parser_ ? parser_->stats() : ParserStats();
}

void LdifFileReader::close() {
    if (file_.is_open()) {
        file_.close();
        spdlog::debug("Closed {}", filePath_);
    }
}

} // namespace ldif
} // namespace ldiftap
