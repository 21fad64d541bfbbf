/**
 * @file ldif_parser.h
 * @brief Streaming LDIF parser
 *
 * Turns a sequence of input lines into LdifEntry records, one entry per
 * call to next(). Entries are delimited by "dn:" lines; blank lines do
 * not end an entry.
 *
 * Line handling, in priority order:
 *   1. blank or "#" comment line      ignored
 *   2. " " continuation line          appended to the pending value
 *   3. "dn:" / "dn::" line            finalizes the open entry, starts a new one
 *   4. "name:" / "name::" line        attribute value (base64 for "::")
 *   5. "-" line                       change-record separator, ignored
 *   6. anything else in an entry      unparseable line
 *
 * A value is committed (decoded, filtered and stored) when its logical
 * line ends, so folded base64 values decode as a whole.
 */

#pragma once

#include "ldiftap/common/exceptions.h"
#include "ldiftap/ldif/entry_filter.h"
#include "ldiftap/ldif/ldif_entry.h"
#include "ldiftap/ldif/line_reader.h"
#include <optional>
#include <string>
#include <utility>

namespace ldiftap {
namespace ldif {

/**
 * @brief Outcome of handling one line
 *
 * Recoverable conditions are returned, not thrown; the parser decides
 * between abort (strict) and skip (lenient).
 */
class LineResult {
public:
    static LineResult ok() { return LineResult(); }

    static LineResult error(common::ParseErrorKind kind, int lineNumber, std::string message) {
        LineResult result;
        result.error_ = kind;
        result.lineNumber_ = lineNumber;
        result.message_ = std::move(message);
        return result;
    }

    bool isOk() const { return !error_.has_value(); }
    common::ParseErrorKind kind() const { return *error_; }
    int lineNumber() const { return lineNumber_; }
    const std::string& message() const { return message_; }

private:
    std::optional<common::ParseErrorKind> error_;
    int lineNumber_ = 0;
    std::string message_;
};

/**
 * @brief Parser counters
 */
struct ParserStats {
    size_t linesRead = 0;
    size_t entriesYielded = 0;
    size_t entriesFiltered = 0;     // Dropped by base DN / objectClass filters
    size_t entriesWithoutDn = 0;    // Dropped for an empty DN
    size_t linesSkipped = 0;        // Unparseable lines skipped in lenient mode
    size_t valuesDropped = 0;       // Undecodable base64 values in lenient mode
    size_t valuesFiltered = 0;      // Values removed by attribute filters
};

/**
 * @brief Pull-based LDIF parser
 *
 * Single-pass and forward-only: once next() has returned std::nullopt
 * or thrown, the parser stays exhausted. The LineReader is borrowed and
 * must outlive the parser.
 */
class LdifParser {
public:
    LdifParser(LineReader& reader, const FilterConfig& config, std::string sourceFile);

    /**
     * @brief Parse up to and including the next accepted entry
     *
     * @return Next entry, or std::nullopt at end of input
     * @throws common::ParseException on malformed input under strict parsing
     * @throws common::DecodeException if a line is not valid in the encoding
     */
    std::optional<LdifEntry> next();

    bool exhausted() const { return exhausted_; }
    const ParserStats& stats() const { return stats_; }

private:
    enum class State {
        AwaitingEntry,
        InEntry
    };

    enum class PendingKind {
        None,
        Dn,
        Attribute
    };

    /**
     * @brief Logical line being accumulated (primary line plus continuations)
     */
    struct PendingLine {
        PendingKind kind = PendingKind::None;
        std::string name;
        std::string value;
        bool base64 = false;
        int lineNumber = 0;
    };

    std::optional<LdifEntry> processLine(const RawLine& line);
    void handleContinuation(const RawLine& line);
    std::optional<LdifEntry> handleDnLine(const RawLine& line, bool base64, const std::string& value);
    void handleAttributeLine(const RawLine& line, const std::string& name,
                             bool base64, const std::string& value);

    LineResult commitPending();
    LineResult commitDn(const PendingLine& pending);
    LineResult commitAttribute(const PendingLine& pending);
    std::optional<LdifEntry> finalizeEntry();

    void report(const LineResult& result);

    LineReader& reader_;
    FilterConfig config_;
    EntryFilter filter_;
    std::string sourceFile_;

    State state_ = State::AwaitingEntry;
    LdifEntry current_;
    PendingLine pending_;
    bool exhausted_ = false;
    ParserStats stats_;
};

} // namespace ldif
} // namespace ldiftap
