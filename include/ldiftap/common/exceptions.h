/**
 * @file exceptions.h
 * @brief Exception hierarchy for ldif-tap
 *
 * File-scoped failures are thrown as exceptions. Recoverable per-line
 * conditions are reported as ldif::LineResult values and only become
 * exceptions when strict parsing is enabled.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ldiftap {
namespace common {

/**
 * @brief Base exception for all ldif-tap exceptions
 */
class LdifTapException : public std::runtime_error {
public:
    explicit LdifTapException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public LdifTapException {
public:
    explicit ConfigException(const std::string& message)
        : LdifTapException("Configuration error: " + message) {}
};

/**
 * @brief File cannot be found, opened or read
 */
class FileException : public LdifTapException {
public:
    FileException(const std::string& filePath, const std::string& message)
        : LdifTapException("File error: " + filePath + ": " + message),
          filePath_(filePath) {}

    const std::string& filePath() const { return filePath_; }

private:
    std::string filePath_;
};

/**
 * @brief File content is not valid in the configured encoding
 */
class DecodeException : public LdifTapException {
public:
    DecodeException(const std::string& filePath, int lineNumber, const std::string& encoding)
        : LdifTapException("Decode error: " + filePath + " line " + std::to_string(lineNumber) +
                           " is not valid " + encoding),
          filePath_(filePath),
          lineNumber_(lineNumber) {}

    const std::string& filePath() const { return filePath_; }
    int lineNumber() const { return lineNumber_; }

private:
    std::string filePath_;
    int lineNumber_;
};

/**
 * @brief Kind of a per-line parse failure
 */
enum class ParseErrorKind {
    Base64Decode,     ///< Malformed base64 in a "::" value
    UnparseableLine   ///< Line matches neither the DN nor an attribute form
};

/**
 * @brief Parsing error raised under strict parsing
 */
class ParseException : public LdifTapException {
public:
    ParseException(ParseErrorKind kind,
                   const std::string& filePath,
                   int lineNumber,
                   const std::string& message,
                   const std::string& entryDn = "")
        : LdifTapException("Parsing error: " + filePath + ":" + std::to_string(lineNumber) +
                           ": " + message),
          kind_(kind),
          filePath_(filePath),
          lineNumber_(lineNumber),
          entryDn_(entryDn) {}

    ParseErrorKind kind() const { return kind_; }
    const std::string& filePath() const { return filePath_; }
    int lineNumber() const { return lineNumber_; }
    const std::string& entryDn() const { return entryDn_; }

private:
    ParseErrorKind kind_;
    std::string filePath_;
    int lineNumber_;
    std::string entryDn_;
};

} // namespace common
} // namespace ldiftap
