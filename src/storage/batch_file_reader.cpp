#include "storage/batch_file_reader.hpp"
#include <arrow/array/util.h>
#include <arrow/ipc/reader.h>
#include <arrow/record_batch.h>
#include <arrow/type.h>
#include <fmt/format.h>
#include <algorithm>
#include <string>
#include "common/arrow_status.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace batchfile {

BatchFileReader::BatchFileReader(std::shared_ptr<arrow::fs::FileSystem> fs, const std::filesystem::path& basePath,
                                 const FileMetadata& metadata, arrow::MemoryPool* pool, ReaderOptions options)
    : fs_(std::move(fs)),
      metadata_(metadata),
      pool_(pool),
      options_(options),
      path_(basePath / metadata.path),
      state_(State::UNOPENED) {}

BatchFileReader::~BatchFileReader() = default;

void BatchFileReader::checkRange(uint64_t start, uint64_t limit) const {
    const uint64_t recordCount = metadata_.recordCount;

    // start == 0 stays valid on an empty file so that empty files can be probed with (0, 0)
    if (!((start == 0 && recordCount == 0) || start < recordCount)) {
        throw InvalidArgumentException(
            fmt::format("Invalid start index ({}). Record count in file ({})", start, recordCount),
            {{"path", path_.string()}});
    }
    if (limit > recordCount - start) {
        throw InvalidArgumentException(
            fmt::format("Invalid start index ({}) and limit ({}) combination. Record count in file ({})", start,
                        limit, recordCount),
            {{"path", path_.string()}});
    }
}

void BatchFileReader::openFile() {
    const std::string path = path_.string();
    InputStream stream = InputStream::open(*fs_, path);

    if (options_.validateFraming) {
        format::readFooterOffset(stream, getFileSize(), scratch_);
    }

    stream_.emplace(std::move(stream));
    state_ = State::OPEN;
}

int64_t BatchFileReader::getFileSize() {
    const std::string path = path_.string();
    auto info = valueOrThrow(fs_->GetFileInfo(path), path);
    return info.size();
}

std::vector<BatchWindow> BatchFileReader::read(uint64_t start, uint64_t limit) {
    if (state_ == State::CLOSED) {
        throw IllegalStateException("Reader is closed", path_.string());
    }

    checkRange(start, limit);

    if (state_ == State::UNOPENED) {
        openFile();
    }

    std::vector<BatchWindow> batches;

    uint64_t runningCount = 0;
    uint64_t remaining = limit;
    for (const auto& batchSummary : metadata_.footer.batches) {
        if (remaining == 0) {
            break;
        }

        // Skip past empty batches
        if (batchSummary.recordCount == 0) {
            continue;
        }

        runningCount += batchSummary.recordCount;

        // Rows up to and including this batch are [0, runningCount - 1]
        if (start >= runningCount) {
            continue;
        }

        const uint64_t currentBatchCount = batchSummary.recordCount;
        const uint64_t batchFirstRow = runningCount - currentBatchCount;

        auto batch = decodeBatchAt(batchSummary);

        const uint64_t batchStart = start > batchFirstRow ? start - batchFirstRow : 0;
        const uint64_t batchEnd = std::min(currentBatchCount, batchStart + remaining);

        // holds even when row counts are not verified, the window must stay inside the decoded batch
        if (batchEnd > static_cast<uint64_t>(batch->num_rows())) {
            Logger::error("Batch at offset {} in '{}' has {} rows, {} requested from it", batchSummary.offset,
                          path_.string(), batch->num_rows(), batchEnd);
            throw DataFormatException("Record batch holds fewer rows than the footer lists", path_.string(),
                                      {{"offset", std::to_string(batchSummary.offset)},
                                       {"decoded rows", std::to_string(batch->num_rows())},
                                       {"footer rows", std::to_string(currentBatchCount)}});
        }

        batches.emplace_back(std::move(batch), static_cast<int64_t>(batchStart), static_cast<int64_t>(batchEnd));
        remaining -= batchEnd - batchStart;
    }

    if (remaining != 0) {
        Logger::error("Footer of '{}' lists {} records, metadata claims {}", path_.string(), runningCount,
                      metadata_.recordCount);
        throw DataFormatException("Footer holds fewer records than the file metadata", path_.string(),
                                  {{"footer records", std::to_string(metadata_.footer.recordCount())},
                                   {"metadata records", std::to_string(metadata_.recordCount)}});
    }

    if (batches.empty()) {
        batches.push_back(getEmptyBatch());
    }

    Logger::debug("Read [{}, {}) of '{}' from {} batches", start, start + limit, path_.string(), batches.size());
    return batches;
}

std::shared_ptr<arrow::RecordBatch> BatchFileReader::decodeBatchAt(const BatchSummary& summary) {
    const std::string path = path_.string();

    // Seek to the place where the batch starts and read
    stream_->seek(static_cast<int64_t>(summary.offset));

    auto readOptions = arrow::ipc::IpcReadOptions::Defaults();
    readOptions.memory_pool = pool_;
    readOptions.use_threads = false;

    auto decodeError = [&](const arrow::Status& status) {
        if (status.IsIOError()) {
            throwIfError(status, path);
        }
        Logger::error("Cannot decode batch at offset {} in '{}': {}", summary.offset, path, status.ToString());
        return DataFormatException("Malformed record batch", path,
                                   {{"offset", std::to_string(summary.offset)}, {"status", status.ToString()}});
    };

    auto readerResult = arrow::ipc::RecordBatchStreamReader::Open(&stream_->file(), readOptions);
    if (!readerResult.ok()) {
        throw decodeError(readerResult.status());
    }
    auto reader = std::move(readerResult).ValueUnsafe();

    std::shared_ptr<arrow::RecordBatch> batch;
    auto status = reader->ReadNext(&batch);
    if (!status.ok()) {
        throw decodeError(status);
    }
    if (batch == nullptr) {
        throw DataFormatException("Record batch stream holds no batch", path,
                                  {{"offset", std::to_string(summary.offset)}});
    }

    if (options_.verifyRowCounts && static_cast<uint64_t>(batch->num_rows()) != summary.recordCount) {
        Logger::error("Batch at offset {} in '{}' has {} rows, footer says {}", summary.offset, path,
                      batch->num_rows(), summary.recordCount);
        throw DataFormatException("Record batch row count does not match footer", path,
                                  {{"offset", std::to_string(summary.offset)},
                                   {"decoded rows", std::to_string(batch->num_rows())},
                                   {"footer rows", std::to_string(summary.recordCount)}});
    }

    Logger::trace("Decoded {} at {}", summary, path);
    return batch;
}

BatchWindow BatchFileReader::getEmptyBatch() {
    std::shared_ptr<arrow::Schema> schema = metadata_.schema;
    if (!schema) {
        schema = readFooter(*stream_, getFileSize(), scratch_).schema;
    }

    arrow::ArrayVector columns;
    columns.reserve(schema->num_fields());
    for (const auto& field : schema->fields()) {
        columns.push_back(valueOrThrow(arrow::MakeEmptyArray(field->type(), pool_), path_.string()));
    }

    return BatchWindow{arrow::RecordBatch::Make(schema, 0, std::move(columns)), 0, 0};
}

void BatchFileReader::close() {
    if (state_ == State::CLOSED) {
        return;
    }
    state_ = State::CLOSED;

    if (stream_) {
        // reset the optional even if closing fails, the handle is gone either way
        std::optional<InputStream> stream = std::move(stream_);
        stream_.reset();
        stream->close();
    }
}

}  // namespace batchfile
