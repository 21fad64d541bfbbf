/**
 * @file main.cpp
 * @brief ldif-tap command line entry point
 *
 * Streams LDIF entries as JSON lines on stdout; logs go to stderr.
 *
 * Exit codes: 0 success, 1 configuration error, 2 extraction failure.
 */

#include "ldiftap/common/exceptions.h"
#include "ldiftap/common/logger.h"
#include "ldiftap/config/tap_config.h"
#include "ldiftap/io/record_sink.h"
#include "ldiftap/ldif_extractor.h"
#include <spdlog/spdlog.h>
#include <iostream>
#include <optional>
#include <string>

using namespace ldiftap;

namespace {

constexpr const char* VERSION = "1.0.0";

constexpr int EXIT_OK = 0;
constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_EXTRACTION_ERROR = 2;

struct CommandLine {
    std::optional<std::string> configFile;
    std::optional<std::string> filePath;
    std::optional<std::string> directoryPath;
    std::optional<std::string> filePattern;
    std::optional<std::string> logLevel;
    bool lenient = false;
    bool help = false;
};

void printUsage(std::ostream& out) {
    out << "Usage: ldif-tap [options]\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>       JSON configuration file\n"
        << "  --file <path>         LDIF file to extract\n"
        << "  --directory <path>    Directory scanned for LDIF files\n"
        << "  --pattern <glob>      File name pattern for --directory (default *.ldif)\n"
        << "  --lenient             Skip malformed lines instead of failing\n"
        << "  --log-level <level>   trace, debug, info, warn, error, critical, off\n"
        << "  --help                Show this message\n"
        << "\n"
        << "Environment variables prefixed LDIF_TAP_ override the config file;\n"
        << "command line options override both.\n";
}

CommandLine parseArguments(int argc, char* argv[]) {
    CommandLine cmd;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto requireValue = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw common::ConfigException("option " + arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--config") {
            cmd.configFile = requireValue();
        } else if (arg == "--file") {
            cmd.filePath = requireValue();
        } else if (arg == "--directory") {
            cmd.directoryPath = requireValue();
        } else if (arg == "--pattern") {
            cmd.filePattern = requireValue();
        } else if (arg == "--log-level") {
            cmd.logLevel = requireValue();
        } else if (arg == "--lenient") {
            cmd.lenient = true;
        } else {
            throw common::ConfigException("unknown option: " + arg);
        }
    }
    return cmd;
}

config::TapConfig loadConfig(const CommandLine& cmd) {
    config::TapConfig cfg;
    if (cmd.configFile) {
        cfg = config::TapConfig::fromJsonFile(*cmd.configFile);
    }
    cfg.applyEnvironment();

    if (cmd.filePath) cfg.filePath = cmd.filePath;
    if (cmd.directoryPath) cfg.directoryPath = cmd.directoryPath;
    if (cmd.filePattern) cfg.filePattern = *cmd.filePattern;
    if (cmd.logLevel) cfg.logLevel = *cmd.logLevel;
    if (cmd.lenient) cfg.strictParsing = false;

    cfg.validate();
    return cfg;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Console logging until the configured level and file are known
    common::Logger::initialize("ldif-tap");

    config::TapConfig cfg;
    try {
        CommandLine cmd = parseArguments(argc, argv);
        if (cmd.help) {
            printUsage(std::cout);
            return EXIT_OK;
        }
        cfg = loadConfig(cmd);
    } catch (const common::ConfigException& e) {
        spdlog::error("{}", e.what());
        printUsage(std::cerr);
        return EXIT_CONFIG_ERROR;
    }

    common::Logger::initialize("ldif-tap", cfg.logLevel, !cfg.logFile.empty(), cfg.logFile);

    spdlog::info("Starting ldif-tap {}", VERSION);
    spdlog::info("Input: file={}, directory={}, pattern={}",
                 cfg.filePath.value_or("-"), cfg.directoryPath.value_or("-"), cfg.filePattern);
    spdlog::info("Mode: {}, encoding={}, batch size={}",
                 cfg.strictParsing ? "strict" : "lenient", cfg.encoding, cfg.batchSize);

    int exitCode = EXIT_OK;
    try {
        io::JsonLinesSink sink(std::cout);
        LdifExtractor extractor(cfg, sink);
        ExtractionSummary summary = extractor.run();

        if (!summary.errors.empty()) {
            spdlog::warn("{} error(s) during extraction", summary.errors.size());
            for (const auto& error : summary.errors) {
                spdlog::warn("  {}", error);
            }
        }
    } catch (const common::ConfigException& e) {
        spdlog::error("{}", e.what());
        exitCode = EXIT_CONFIG_ERROR;
    } catch (const common::LdifTapException& e) {
        spdlog::error("Extraction failed: {}", e.what());
        exitCode = EXIT_EXTRACTION_ERROR;
    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        exitCode = EXIT_EXTRACTION_ERROR;
    }

    common::Logger::flush();
    return exitCode;
}
