/**
 * @file ldif_parser.cpp
 * @brief Streaming LDIF parser implementation
 */

#include "ldiftap/ldif/ldif_parser.h"
#include "ldiftap/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <cctype>
#include <regex>
#include <utility>

namespace ldiftap {
namespace ldif {

namespace {

// Attribute description: name plus optional ";option" suffixes
const std::regex ATTRIBUTE_DESCRIPTION(R"([a-zA-Z][a-zA-Z0-9-]*(;[a-zA-Z0-9-]+)*)");

/**
 * @brief "name:value" or "name::value" split at the first colon
 *
 * Only the attribute description goes through the regex; values can be
 * very long (inline base64) and are sliced directly.
 */
struct ValueLine {
    std::string name;
    bool base64 = false;
    std::string value;
};

std::optional<ValueLine> splitValueLine(const std::string& text) {
    size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }

    ValueLine line;
    line.name = text.substr(0, colon);
    if (!std::regex_match(line.name, ATTRIBUTE_DESCRIPTION)) {
        return std::nullopt;
    }

    size_t pos = colon + 1;
    if (pos < text.size() && text[pos] == ':') {
        line.base64 = true;
        ++pos;
    }
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    line.value = text.substr(pos);
    return line;
}

bool isDnLine(const ValueLine& line) {
    return utils::toLower(line.name) == "dn";
}

const size_t MAX_LINE_PREVIEW = 80;

std::string preview(const std::string& text) {
    if (text.size() <= MAX_LINE_PREVIEW) {
        return text;
    }
    return text.substr(0, MAX_LINE_PREVIEW) + "...";
}

} // anonymous namespace

LdifParser::LdifParser(LineReader& reader, const FilterConfig& config, std::string sourceFile)
    : reader_(reader),
      config_(config),
      filter_(config),
      sourceFile_(std::move(sourceFile)) {}

std::optional<LdifEntry> LdifParser::next() {
    if (exhausted_) {
        return std::nullopt;
    }

    while (true) {
        std::optional<RawLine> line;
        try {
            line = reader_.next();
        } catch (const common::DecodeException&) {
            exhausted_ = true;
            throw;
        }
        if (!line) {
            break;
        }

        ++stats_.linesRead;
        auto completed = processLine(*line);
        if (completed) {
            return completed;
        }
    }

    // End of input closes the last entry
    exhausted_ = true;
    if (state_ == State::InEntry) {
        report(commitPending());
        return finalizeEntry();
    }
    return std::nullopt;
}

std::optional<LdifEntry> LdifParser::processLine(const RawLine& line) {
    const std::string& text = line.text;

    if (utils::trimRight(text).empty() || text[0] == '#') {
        return std::nullopt;
    }

    if (text[0] == ' ') {
        handleContinuation(line);
        return std::nullopt;
    }

    auto valueLine = splitValueLine(text);
    if (valueLine && isDnLine(*valueLine)) {
        return handleDnLine(line, valueLine->base64, valueLine->value);
    }

    if (state_ == State::AwaitingEntry) {
        // e.g. "version: 1" before the first entry
        spdlog::debug("{}:{}: outside of an entry, ignored: {}",
                      sourceFile_, line.lineNumber, preview(text));
        return std::nullopt;
    }

    if (valueLine) {
        handleAttributeLine(line, utils::toLower(valueLine->name), valueLine->base64,
                            valueLine->value);
        return std::nullopt;
    }

    // Any other line ends the pending value
    report(commitPending());

    if (text[0] == '-') {
        current_.entrySize += line.byteLength;
        return std::nullopt;
    }

    report(LineResult::error(common::ParseErrorKind::UnparseableLine, line.lineNumber,
                             "unparseable line: '" + preview(text) + "'"));
    return std::nullopt;
}

void LdifParser::handleContinuation(const RawLine& line) {
    if (pending_.kind == PendingKind::None) {
        if (state_ == State::InEntry) {
            report(LineResult::error(common::ParseErrorKind::UnparseableLine, line.lineNumber,
                                     "continuation line without a preceding value"));
        } else {
            spdlog::debug("{}:{}: continuation outside of an entry, ignored",
                          sourceFile_, line.lineNumber);
        }
        return;
    }

    pending_.value += line.text.substr(1);
    current_.entrySize += line.byteLength;
}

std::optional<LdifEntry> LdifParser::handleDnLine(const RawLine& line, bool base64,
                                                  const std::string& value) {
    report(commitPending());

    std::optional<LdifEntry> completed;
    if (state_ == State::InEntry) {
        completed = finalizeEntry();
    }

    current_ = LdifEntry();
    current_.sourceFile = sourceFile_;
    current_.lineNumber = line.lineNumber;
    current_.entrySize = line.byteLength;
    state_ = State::InEntry;

    pending_.kind = PendingKind::Dn;
    pending_.name = "dn";
    pending_.value = value;
    pending_.base64 = base64;
    pending_.lineNumber = line.lineNumber;

    return completed;
}

void LdifParser::handleAttributeLine(const RawLine& line, const std::string& name,
                                     bool base64, const std::string& value) {
    report(commitPending());

    current_.entrySize += line.byteLength;

    pending_.kind = PendingKind::Attribute;
    pending_.name = name;
    pending_.value = value;
    pending_.base64 = base64;
    pending_.lineNumber = line.lineNumber;
}

LineResult LdifParser::commitPending() {
    PendingLine pending = std::move(pending_);
    pending_ = PendingLine();

    switch (pending.kind) {
        case PendingKind::Dn:        return commitDn(pending);
        case PendingKind::Attribute: return commitAttribute(pending);
        case PendingKind::None:      break;
    }
    return LineResult::ok();
}

LineResult LdifParser::commitDn(const PendingLine& pending) {
    std::string dn = pending.value;
    if (pending.base64) {
        auto decoded = utils::fromBase64(dn);
        if (!decoded) {
            return LineResult::error(common::ParseErrorKind::Base64Decode, pending.lineNumber,
                                     "invalid base64 DN");
        }
        dn = *decoded;
    }
    current_.dn = utils::trim(dn);
    return LineResult::ok();
}

LineResult LdifParser::commitAttribute(const PendingLine& pending) {
    std::string value;
    if (pending.base64) {
        auto decoded = utils::fromBase64(pending.value);
        if (!decoded) {
            return LineResult::error(common::ParseErrorKind::Base64Decode, pending.lineNumber,
                                     "invalid base64 value for attribute '" + pending.name + "'");
        }
        value = std::move(*decoded);
    } else {
        value = pending.value;
    }

    // Derived fields ignore attribute filters
    if (pending.name == "objectclass") {
        current_.objectClass.push_back(value);
    } else if (pending.name == "changetype" && !current_.changeType) {
        current_.changeType = value;
    }

    if (!filter_.acceptsAttribute(pending.name)) {
        ++stats_.valuesFiltered;
        return LineResult::ok();
    }

    current_.attributes.add(pending.name, std::move(value));
    return LineResult::ok();
}

std::optional<LdifEntry> LdifParser::finalizeEntry() {
    state_ = State::AwaitingEntry;
    LdifEntry entry = std::move(current_);
    current_ = LdifEntry();

    if (entry.dn.empty()) {
        ++stats_.entriesWithoutDn;
        spdlog::debug("{}:{}: entry without DN dropped", sourceFile_, entry.lineNumber);
        return std::nullopt;
    }

    if (!filter_.acceptsEntry(entry)) {
        ++stats_.entriesFiltered;
        spdlog::debug("{}:{}: entry filtered: {}", sourceFile_, entry.lineNumber, entry.dn);
        return std::nullopt;
    }

    filter_.finalize(entry);
    ++stats_.entriesYielded;
    return entry;
}

void LdifParser::report(const LineResult& result) {
    if (result.isOk()) {
        return;
    }

    if (config_.strictParsing) {
        exhausted_ = true;
        throw common::ParseException(result.kind(), sourceFile_, result.lineNumber(),
                                     result.message(), current_.dn);
    }

    spdlog::warn("{}:{}: {} (skipped)", sourceFile_, result.lineNumber(), result.message());
    if (result.kind() == common::ParseErrorKind::Base64Decode) {
        ++stats_.valuesDropped;
    } else {
        ++stats_.linesSkipped;
    }
}

} // namespace ldif
} // namespace ldiftap
