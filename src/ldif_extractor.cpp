/**
 * @file ldif_extractor.cpp
 * @brief LDIF extraction driver implementation
 */

#include "ldiftap/ldif_extractor.h"
#include "ldiftap/common/exceptions.h"
#include "ldiftap/io/file_discovery.h"
#include "ldiftap/ldif/ldif_file_reader.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <utility>

namespace ldiftap {

LdifExtractor::LdifExtractor(config::TapConfig config, io::RecordSink& sink)
    : config_(std::move(config)), sink_(sink) {}

ExtractionSummary LdifExtractor::run() {
    config_.validate();

    ExtractionSummary summary;

    io::DiscoveryOptions options;
    options.filePath = config_.filePath;
    options.directoryPath = config_.directoryPath;
    options.filePattern = config_.filePattern;
    options.maxFileSizeMb = config_.maxFileSizeMb;
    options.strict = config_.strictParsing;

    io::DiscoveryResult discovered;
    try {
        discovered = io::FileDiscovery(options).discover();
    } catch (const common::FileException& e) {
        spdlog::error("File discovery failed: {}", e.what());
        if (config_.strictParsing) {
            throw;
        }
        summary.errors.push_back(e.what());
        return summary;
    }
    summary.filesSkipped += discovered.skipped.size();

    io::RecordBatcher batcher(sink_, static_cast<size_t>(config_.batchSize));
    auto start = std::chrono::steady_clock::now();

    for (const auto& path : discovered.files) {
        try {
            extractFile(path, batcher, summary);
        } catch (const common::LdifTapException& e) {
            // Records of earlier entries of this file are already batched
            batcher.flush();
            if (config_.strictParsing) {
                spdlog::error("Error processing file {}: {}", path, e.what());
                throw;
            }
            spdlog::warn("Skipping file {} due to error: {}", path, e.what());
            ++summary.filesFailed;
            summary.errors.push_back(e.what());
        }
    }

    batcher.flush();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::info("Extraction complete: {} file(s), {} entries emitted, {} filtered, "
                 "{} failed, {} skipped ({} ms)",
                 summary.filesProcessed, summary.entriesEmitted, summary.entriesFiltered,
                 summary.filesFailed, summary.filesSkipped, elapsed);

    return summary;
}

size_t LdifExtractor::extractFile(const std::string& path, io::RecordBatcher& batcher,
                                  ExtractionSummary& summary) {
    spdlog::info("Processing LDIF file: {}", path);

    ldif::LdifFileReader reader(path, config_.filterConfig());
    if (reader.abandoned()) {
        ++summary.filesSkipped;
        summary.errors.push_back("encoding error in " + path);
        return 0;
    }

    size_t emitted = 0;
    while (auto entry = reader.next()) {
        batcher.add(entry->toJson());
        ++emitted;
    }

    const auto stats = reader.stats();
    ++summary.filesProcessed;
    summary.entriesEmitted += emitted;
    summary.entriesFiltered += stats.entriesFiltered;
    summary.linesSkipped += stats.linesSkipped;
    summary.valuesDropped += stats.valuesDropped;

    spdlog::info("Processed {}: {} entries emitted, {} filtered, {} lines read",
                 path, emitted, stats.entriesFiltered, stats.linesRead);
    if (emitted == 0) {
        spdlog::warn("No entries found in file: {}", path);
    }
    return emitted;
}

} // namespace ldiftap
