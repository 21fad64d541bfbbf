/**
 * @file record_sink.cpp
 * @brief Record sink implementations
 */

#include "ldiftap/io/record_sink.h"
#include "ldiftap/common/exceptions.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace ldiftap {
namespace io {

JsonLinesSink::JsonLinesSink(std::ostream& out)
    : out_(out) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    writer_.reset(builder.newStreamWriter());
}

void JsonLinesSink::write(const std::vector<Json::Value>& batch) {
    for (const auto& record : batch) {
        writer_->write(record, &out_);
        out_ << '\n';
    }
    if (!out_) {
        throw common::LdifTapException("failed to write records to output stream");
    }
    recordsWritten_ += batch.size();
}

void JsonLinesSink::flush() {
    out_.flush();
}

RecordBatcher::RecordBatcher(RecordSink& sink, size_t batchSize)
    : sink_(sink), batchSize_(std::max<size_t>(batchSize, 1)) {
    buffer_.reserve(batchSize_);
}

void RecordBatcher::add(Json::Value record) {
    buffer_.push_back(std::move(record));
    if (buffer_.size() >= batchSize_) {
        emit();
    }
}

void RecordBatcher::flush() {
    if (!buffer_.empty()) {
        emit();
    }
    sink_.flush();
}

void RecordBatcher::emit() {
    sink_.write(buffer_);
    ++batchesEmitted_;
    spdlog::debug("Emitted batch {} ({} records)", batchesEmitted_, buffer_.size());
    buffer_.clear();
}

} // namespace io
} // namespace ldiftap
