/**
 * @file ldif_extractor.h
 * @brief Drives discovery, parsing and record emission
 */

#pragma once

#include "ldiftap/config/tap_config.h"
#include "ldiftap/io/record_sink.h"
#include <string>
#include <vector>

namespace ldiftap {

/**
 * @brief Outcome of one extraction run
 */
struct ExtractionSummary {
    size_t filesProcessed = 0;
    size_t filesFailed = 0;      // Aborted by an error (lenient mode)
    size_t filesSkipped = 0;     // Oversized, or abandoned for an encoding error
    size_t entriesEmitted = 0;
    size_t entriesFiltered = 0;
    size_t linesSkipped = 0;
    size_t valuesDropped = 0;
    std::vector<std::string> errors;
};

/**
 * @brief LDIF extraction driver
 *
 * Files are processed strictly one after another with one open handle
 * at a time. Under strict parsing the first file-scoped error
 * propagates; otherwise it is logged, recorded and the next file is
 * processed.
 */
class LdifExtractor {
public:
    LdifExtractor(config::TapConfig config, io::RecordSink& sink);

    /**
     * @brief Extract every discovered file into the sink
     *
     * @throws common::LdifTapException subclasses under strict parsing
     */
    ExtractionSummary run();

    /**
     * @brief Extract one file into the batcher
     *
     * @return Number of entries emitted
     */
    size_t extractFile(const std::string& path, io::RecordBatcher& batcher,
                       ExtractionSummary& summary);

private:
    config::TapConfig config_;
    io::RecordSink& sink_;
};

} // namespace ldiftap
