/**
 * @file test_ldif_extractor.cpp
 * @brief Integration tests for the extraction driver and record sinks
 *
 * Runs the extractor over LDIF files written to a temporary directory
 * and inspects the records handed to the sink.
 */

#include <gtest/gtest.h>
#include <ldiftap/common/exceptions.h>
#include <ldiftap/io/record_sink.h>
#include <ldiftap/ldif/ldif_file_reader.h>
#include <ldiftap/ldif_extractor.h>
#include <ldiftap/utils/string_utils.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace ldiftap;

namespace {

// Collects records and batch sizes in memory
class CapturingSink : public io::RecordSink {
public:
    void write(const std::vector<Json::Value>& batch) override {
        batchSizes.push_back(batch.size());
        records.insert(records.end(), batch.begin(), batch.end());
    }

    void flush() override { ++flushes; }

    std::vector<Json::Value> records;
    std::vector<size_t> batchSizes;
    int flushes = 0;
};

const char* USERS_LDIF =
    "version: 1\n"
    "\n"
    "dn: cn=alice,ou=users,dc=example,dc=com\n"
    "objectClass: top\n"
    "objectClass: person\n"
    "cn: alice\n"
    "mail: alice@example.com\n"
    "mail: a.smith@example.com\n"
    "createTimestamp: 20240101000000Z\n"
    "\n"
    "dn: cn=admins,ou=groups,dc=example,dc=com\n"
    "objectClass: top\n"
    "objectClass: groupOfNames\n"
    "cn: admins\n"
    "description: Directory\n"
    "  administrators\n"
    "\n"
    "dn: cn=bob,ou=users,dc=other,dc=com\n"
    "objectClass: person\n"
    "cn: bob\n";

} // anonymous namespace

class LdifExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/ldiftap_extract_XXXXXX";
        char* dir = ::mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        dir_ = dir;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        fs::path path = fs::path(dir_) / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    config::TapConfig directoryConfig() {
        config::TapConfig config;
        config.directoryPath = dir_;
        return config;
    }

    std::string dir_;
};

// =============================================================================
// Record content
// =============================================================================

TEST_F(LdifExtractorTest, EmitsRecordPerEntry) {
    std::string path = writeFile("users.ldif", USERS_LDIF);
    config::TapConfig config;
    config.filePath = path;

    CapturingSink sink;
    auto summary = LdifExtractor(config, sink).run();

    EXPECT_EQ(summary.filesProcessed, 1u);
    EXPECT_EQ(summary.entriesEmitted, 3u);
    ASSERT_EQ(sink.records.size(), 3u);

    const Json::Value& alice = sink.records[0];
    EXPECT_EQ(alice["dn"].asString(), "cn=alice,ou=users,dc=example,dc=com");
    EXPECT_EQ(alice["source_file"].asString(), path);
    EXPECT_EQ(alice["line_number"].asInt(), 3);
    EXPECT_TRUE(alice["change_type"].isNull());
    ASSERT_EQ(alice["object_class"].size(), 2u);
    EXPECT_EQ(alice["object_class"][1].asString(), "person");
    EXPECT_EQ(alice["attributes"]["cn"].asString(), "alice");
    ASSERT_TRUE(alice["attributes"]["mail"].isArray());
    EXPECT_EQ(alice["attributes"]["mail"].size(), 2u);
    EXPECT_FALSE(alice["attributes"].isMember("createtimestamp"));

    const Json::Value& admins = sink.records[1];
    EXPECT_EQ(admins["attributes"]["description"].asString(), "Directory administrators");
}

TEST_F(LdifExtractorTest, FiltersApplied) {
    writeFile("users.ldif", USERS_LDIF);
    auto config = directoryConfig();
    config.baseDnFilter = "dc=example,dc=com";
    config.objectClassFilter = std::vector<std::string>{"person"};

    CapturingSink sink;
    auto summary = LdifExtractor(config, sink).run();

    ASSERT_EQ(sink.records.size(), 1u);
    EXPECT_EQ(sink.records[0]["dn"].asString(), "cn=alice,ou=users,dc=example,dc=com");
    EXPECT_EQ(summary.entriesFiltered, 2u);
}

TEST_F(LdifExtractorTest, AttributeAllowList) {
    writeFile("users.ldif", USERS_LDIF);
    auto config = directoryConfig();
    config.attributeFilter = std::vector<std::string>{"cn"};

    CapturingSink sink;
    LdifExtractor(config, sink).run();

    ASSERT_EQ(sink.records.size(), 3u);
    for (const auto& record : sink.records) {
        EXPECT_EQ(record["attributes"].getMemberNames(), std::vector<std::string>{"cn"});
        EXPECT_GE(record["object_class"].size(), 1u);
    }
}

// =============================================================================
// Batching
// =============================================================================

TEST_F(LdifExtractorTest, RecordsEmittedInBatches) {
    writeFile("users.ldif", USERS_LDIF);
    auto config = directoryConfig();
    config.batchSize = 2;

    CapturingSink sink;
    LdifExtractor(config, sink).run();

    EXPECT_EQ(sink.batchSizes, (std::vector<size_t>{2, 1}));
    EXPECT_GE(sink.flushes, 1);
}

TEST_F(LdifExtractorTest, BatcherFlushEmitsRemainder) {
    CapturingSink sink;
    io::RecordBatcher batcher(sink, 3);

    for (int i = 0; i < 4; ++i) {
        Json::Value record;
        record["n"] = i;
        batcher.add(record);
    }
    EXPECT_EQ(batcher.batchesEmitted(), 1u);
    EXPECT_EQ(batcher.pending(), 1u);

    batcher.flush();
    EXPECT_EQ(batcher.pending(), 0u);
    EXPECT_EQ(sink.batchSizes, (std::vector<size_t>{3, 1}));
    EXPECT_EQ(sink.flushes, 1);
}

TEST_F(LdifExtractorTest, JsonLinesSinkWritesOneObjectPerLine) {
    std::ostringstream out;
    io::JsonLinesSink sink(out);

    Json::Value a;
    a["dn"] = "cn=a";
    Json::Value b;
    b["dn"] = "cn=b";
    sink.write({a, b});
    sink.flush();

    EXPECT_EQ(out.str(), "{\"dn\":\"cn=a\"}\n{\"dn\":\"cn=b\"}\n");
    EXPECT_EQ(sink.recordsWritten(), 2u);
}

TEST_F(LdifExtractorTest, BinaryDnAndObjectClassWrittenAsValidUtf8) {
    std::string path = writeFile("binary.ldif", "dn:: Y249/w==\nobjectClass:: /w==\ncn: a\n");
    ldif::LdifFileReader reader(path, ldif::FilterConfig{});

    auto entry = reader.next();
    ASSERT_TRUE(entry.has_value());

    std::ostringstream out;
    io::JsonLinesSink sink(out);
    sink.write({entry->toJson()});

    const std::string line = out.str();
    EXPECT_TRUE(utils::isValidUtf8(line));
    EXPECT_NE(line.find("\"dn\":\"Y249/w==\""), std::string::npos);
    EXPECT_NE(line.find("\"object_class\":[\"/w==\"]"), std::string::npos);
    EXPECT_NE(line.find("\"objectclass\":\"/w==\""), std::string::npos);
}

// =============================================================================
// Multiple files
// =============================================================================

TEST_F(LdifExtractorTest, FilesProcessedInPathOrder) {
    writeFile("b.ldif", "dn: cn=second\ncn: second\n");
    writeFile("a.ldif", "dn: cn=first\ncn: first\n");
    writeFile("skip.txt", "dn: cn=ignored\n");

    CapturingSink sink;
    auto summary = LdifExtractor(directoryConfig(), sink).run();

    EXPECT_EQ(summary.filesProcessed, 2u);
    ASSERT_EQ(sink.records.size(), 2u);
    EXPECT_EQ(sink.records[0]["dn"].asString(), "cn=first");
    EXPECT_EQ(sink.records[1]["dn"].asString(), "cn=second");
}

TEST_F(LdifExtractorTest, EmptyFileProcessed) {
    writeFile("empty.ldif", "");

    CapturingSink sink;
    auto summary = LdifExtractor(directoryConfig(), sink).run();

    EXPECT_EQ(summary.filesProcessed, 1u);
    EXPECT_EQ(summary.entriesEmitted, 0u);
    EXPECT_TRUE(sink.records.empty());
}

// =============================================================================
// Error policy
// =============================================================================

TEST_F(LdifExtractorTest, StrictParseErrorPropagates) {
    writeFile("a.ldif", "dn: cn=ok\ncn: ok\n\ndn: cn=bad\nnot_an_attribute_line\n");
    writeFile("b.ldif", "dn: cn=later\ncn: later\n");

    CapturingSink sink;
    LdifExtractor extractor(directoryConfig(), sink);
    EXPECT_THROW(extractor.run(), common::ParseException);

    // Entries completed before the error were flushed
    ASSERT_EQ(sink.records.size(), 1u);
    EXPECT_EQ(sink.records[0]["dn"].asString(), "cn=ok");
}

TEST_F(LdifExtractorTest, LenientSkipsBadLinesAndContinues) {
    writeFile("a.ldif", "dn: cn=ok\ncn: ok\nnot_an_attribute_line\nphoto:: ***\n");
    writeFile("b.ldif", "dn: cn=later\ncn: later\n");
    auto config = directoryConfig();
    config.strictParsing = false;

    CapturingSink sink;
    auto summary = LdifExtractor(config, sink).run();

    ASSERT_EQ(sink.records.size(), 2u);
    EXPECT_FALSE(sink.records[0]["attributes"].isMember("photo"));
    EXPECT_EQ(summary.linesSkipped, 1u);
    EXPECT_EQ(summary.valuesDropped, 1u);
    EXPECT_EQ(summary.filesFailed, 0u);
}

TEST_F(LdifExtractorTest, StrictDecodeErrorEmitsNothingFromFile) {
    writeFile("a.ldif", "dn: cn=ok\ncn: ok\n\ndn: cn=bad\ncn: caf\xE9\n");

    CapturingSink sink;
    LdifExtractor extractor(directoryConfig(), sink);
    EXPECT_THROW(extractor.run(), common::DecodeException);
    EXPECT_TRUE(sink.records.empty());
}

TEST_F(LdifExtractorTest, LenientDecodeErrorAbandonsFile) {
    writeFile("a.ldif", "dn: cn=ok\ncn: ok\n\ndn: cn=bad\ncn: caf\xE9\n");
    writeFile("b.ldif", "dn: cn=later\ncn: later\n");
    auto config = directoryConfig();
    config.strictParsing = false;

    CapturingSink sink;
    auto summary = LdifExtractor(config, sink).run();

    ASSERT_EQ(sink.records.size(), 1u);
    EXPECT_EQ(sink.records[0]["dn"].asString(), "cn=later");
    EXPECT_EQ(summary.filesSkipped, 1u);
    EXPECT_EQ(summary.filesProcessed, 1u);
    EXPECT_EQ(summary.errors.size(), 1u);
}

TEST_F(LdifExtractorTest, Latin1Encoding) {
    writeFile("a.ldif", "dn: cn=ok\ncn: caf\xE9\n");
    auto config = directoryConfig();
    config.encoding = "latin-1";

    CapturingSink sink;
    LdifExtractor(config, sink).run();

    ASSERT_EQ(sink.records.size(), 1u);
    EXPECT_EQ(sink.records[0]["attributes"]["cn"].asString(), "caf\xC3\xA9");
}

TEST_F(LdifExtractorTest, MissingInputStrictThrows) {
    config::TapConfig config;
    config.filePath = dir_ + "/missing.ldif";

    CapturingSink sink;
    EXPECT_THROW(LdifExtractor(config, sink).run(), common::FileException);
}

TEST_F(LdifExtractorTest, MissingInputLenientRecordsError) {
    config::TapConfig config;
    config.filePath = dir_ + "/missing.ldif";
    config.strictParsing = false;

    CapturingSink sink;
    auto summary = LdifExtractor(config, sink).run();
    EXPECT_EQ(summary.filesProcessed, 0u);
    EXPECT_EQ(summary.errors.size(), 1u);
}

TEST_F(LdifExtractorTest, InvalidConfigRejected) {
    config::TapConfig config;  // no input source

    CapturingSink sink;
    EXPECT_THROW(LdifExtractor(config, sink).run(), common::ConfigException);
}

// =============================================================================
// File reader lifecycle
// =============================================================================

TEST_F(LdifExtractorTest, FileReaderClosesAtEnd) {
    std::string path = writeFile("a.ldif", "dn: cn=a\ncn: a\n");
    ldif::LdifFileReader reader(path, ldif::FilterConfig{});

    EXPECT_TRUE(reader.isOpen());
    EXPECT_TRUE(reader.next().has_value());
    EXPECT_FALSE(reader.next().has_value());
    EXPECT_FALSE(reader.isOpen());
}

TEST_F(LdifExtractorTest, FileReaderClosesOnError) {
    std::string path = writeFile("a.ldif", "dn: cn=a\nbroken\n");
    ldif::LdifFileReader reader(path, ldif::FilterConfig{});

    EXPECT_THROW(reader.next(), common::ParseException);
    EXPECT_FALSE(reader.isOpen());
}

TEST_F(LdifExtractorTest, FileReaderRejectsUnknownEncoding) {
    std::string path = writeFile("a.ldif", "dn: cn=a\n");
    ldif::FilterConfig config;
    config.encoding = "utf-16";
    EXPECT_THROW({ ldif::LdifFileReader reader(path, config); }, common::ConfigException);
}
