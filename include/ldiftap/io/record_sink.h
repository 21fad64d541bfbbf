/**
 * @file record_sink.h
 * @brief Destinations for finalized entry records
 */

#pragma once

#include <json/json.h>
#include <memory>
#include <ostream>
#include <vector>

namespace ldiftap {
namespace io {

/**
 * @brief Receives finalized records in batches
 */
class RecordSink {
public:
    virtual ~RecordSink() = default;

    virtual void write(const std::vector<Json::Value>& batch) = 0;

    virtual void flush() = 0;
};

/**
 * @brief Writes one compact JSON object per line
 */
class JsonLinesSink : public RecordSink {
public:
    explicit JsonLinesSink(std::ostream& out);

    void write(const std::vector<Json::Value>& batch) override;
    void flush() override;

    size_t recordsWritten() const { return recordsWritten_; }

private:
    std::ostream& out_;
    std::unique_ptr<Json::StreamWriter> writer_;
    size_t recordsWritten_ = 0;
};

/**
 * @brief Buffers records and hands them to a sink in batches
 *
 * At most batchSize records are buffered; call flush() after the last
 * add() to emit the trailing partial batch.
 */
class RecordBatcher {
public:
    RecordBatcher(RecordSink& sink, size_t batchSize);

    void add(Json::Value record);

    /**
     * @brief Emit buffered records, then flush the sink
     */
    void flush();

    size_t pending() const { return buffer_.size(); }
    size_t batchesEmitted() const { return batchesEmitted_; }

private:
    void emit();

    RecordSink& sink_;
    size_t batchSize_;
    std::vector<Json::Value> buffer_;
    size_t batchesEmitted_ = 0;
};

} // namespace io
} // namespace ldiftap
