/**
 * @file line_reader.h
 * @brief Line-by-line reader with character-encoding handling
 */

#pragma once

#include <istream>
#include <optional>
#include <string>

namespace ldiftap {
namespace ldif {

/**
 * @brief Supported input encodings
 */
enum class Encoding {
    UTF8,
    ASCII,
    LATIN1
};

/**
 * @brief Resolve an encoding name ("utf-8", "UTF8", "latin_1", ...)
 *
 * @return Encoding, or std::nullopt if unsupported
 */
std::optional<Encoding> parseEncoding(const std::string& name);

/**
 * @brief Canonical encoding name
 */
std::string encodingToString(Encoding encoding);

/**
 * @brief One physical input line
 */
struct RawLine {
    std::string text;       // Decoded to UTF-8, CR/LF stripped
    size_t byteLength = 0;  // Original bytes incl. line terminator
    int lineNumber = 0;     // 1-based
};

/**
 * @brief Pull reader producing one RawLine at a time
 *
 * The stream is borrowed and must outlive the reader.
 */
class LineReader {
public:
    LineReader(std::istream& input, Encoding encoding, std::string sourceName);

    /**
     * @brief Read the next line
     *
     * @return Next line, or std::nullopt at end of input
     * @throws common::DecodeException if the line is not valid in the encoding
     */
    std::optional<RawLine> next();

    int lineNumber() const { return lineNumber_; }

    /**
     * @brief Scan the remaining input for encoding errors
     *
     * Reads the stream to its end without buffering more than one line.
     *
     * @return 1-based line number of the first invalid line, or std::nullopt
     */
    static std::optional<int> findInvalidLine(std::istream& input, Encoding encoding);

private:
    static bool isValid(const std::string& bytes, Encoding encoding);
    static std::string decode(const std::string& bytes, Encoding encoding);

    std::istream& input_;
    Encoding encoding_;
    std::string sourceName_;
    int lineNumber_ = 0;
};

} // namespace ldif
} // namespace ldiftap
