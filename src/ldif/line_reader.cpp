/**
 * @file line_reader.cpp
 * @brief Line reader implementation
 */

#include "ldiftap/ldif/line_reader.h"
#include "ldiftap/common/exceptions.h"
#include "ldiftap/utils/string_utils.h"
#include <algorithm>
#include <utility>

namespace ldiftap {
namespace ldif {

namespace {

const std::string UTF8_BOM = "\xEF\xBB\xBF";

} // anonymous namespace

std::optional<Encoding> parseEncoding(const std::string& name) {
    std::string key = utils::toLower(utils::trim(name));
    std::replace(key.begin(), key.end(), '_', '-');

    if (key == "utf-8" || key == "utf8") {
        return Encoding::UTF8;
    }
    if (key == "ascii" || key == "us-ascii") {
        return Encoding::ASCII;
    }
    if (key == "latin-1" || key == "latin1" || key == "iso-8859-1" || key == "iso8859-1") {
        return Encoding::LATIN1;
    }
    return std::nullopt;
}

std::string encodingToString(Encoding encoding) {
    switch (encoding) {
        case Encoding::UTF8:   return "utf-8";
        case Encoding::ASCII:  return "ascii";
        case Encoding::LATIN1: return "latin-1";
    }
    return "utf-8";
}

LineReader::LineReader(std::istream& input, Encoding encoding, std::string sourceName)
    : input_(input), encoding_(encoding), sourceName_(std::move(sourceName)) {}

std::optional<RawLine> LineReader::next() {
    std::string bytes;
    if (!std::getline(input_, bytes)) {
        return std::nullopt;
    }

    RawLine line;
    line.lineNumber = ++lineNumber_;
    // getline hits EOF only when the last line has no terminator
    line.byteLength = bytes.size() + (input_.eof() ? 0 : 1);

    if (!bytes.empty() && bytes.back() == '\r') {
        bytes.pop_back();
    }

    if (line.lineNumber == 1 && encoding_ == Encoding::UTF8 && utils::startsWith(bytes, UTF8_BOM)) {
        bytes.erase(0, UTF8_BOM.size());
    }

    if (!isValid(bytes, encoding_)) {
        throw common::DecodeException(sourceName_, line.lineNumber, encodingToString(encoding_));
    }

    line.text = decode(bytes, encoding_);
    return line;
}

std::optional<int> LineReader::findInvalidLine(std::istream& input, Encoding encoding) {
    if (encoding == Encoding::LATIN1) {
        return std::nullopt;  // every byte sequence is valid latin-1
    }

    std::string bytes;
    int lineNumber = 0;
    while (std::getline(input, bytes)) {
        ++lineNumber;
        if (!isValid(bytes, encoding)) {
            return lineNumber;
        }
    }
    return std::nullopt;
}

bool LineReader::isValid(const std::string& bytes, Encoding encoding) {
    switch (encoding) {
        case Encoding::UTF8:   return utils::isValidUtf8(bytes);
        case Encoding::ASCII:  return utils::isAscii(bytes);
        case Encoding::LATIN1: return true;
    }
    return false;
}

std::string LineReader::decode(const std::string& bytes, Encoding encoding) {
    if (encoding == Encoding::LATIN1) {
        return utils::latin1ToUtf8(bytes);
    }
    return bytes;
}

} // namespace ldif
} // namespace ldiftap
