#pragma once

#include <arrow/api.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "storage/batch_window.hpp"
#include "storage/file_footer.hpp"
#include "storage/file_metadata.hpp"

namespace batchfile::test {

/**
 * @brief Schema used by most tests: id INT64 (not null), name STRING
 */
std::shared_ptr<arrow::Schema> testSchema();

/**
 * @brief Batch of testSchema() with ids [firstId, firstId + count) and names "row-<id>"
 */
std::shared_ptr<arrow::RecordBatch> makeSequenceBatch(int64_t firstId, int64_t count);

/**
 * @brief Concatenated id column of the rows inside each window, in window order
 */
std::vector<int64_t> collectIds(const std::vector<BatchWindow>& windows);

std::vector<int64_t> idRange(int64_t first, int64_t count);

/**
 * @brief Writes files in the batch file layout. Every knob that a well-behaved writer would
 * never touch (trailing magic, footer offset) can be overridden to produce corrupt files.
 */
class BatchFileBuilder {
public:
    explicit BatchFileBuilder(std::shared_ptr<arrow::Schema> schema = testSchema());

    /**
     * @brief Appends a batch; its footer entry records the batch's row count
     */
    BatchFileBuilder& addBatch(const std::shared_ptr<arrow::RecordBatch>& batch);

    /**
     * @brief Appends batches of the given sizes with consecutive ids starting at 0
     */
    BatchFileBuilder& addSequenceBatches(const std::vector<int64_t>& sizes);

    BatchFileBuilder& setTrailingMagic(std::string magic);

    BatchFileBuilder& setFooterOffset(uint64_t offset);

    std::vector<uint8_t> build() const;

    std::filesystem::path write(const std::filesystem::path& path) const;

    const std::vector<BatchSummary>& getSummaries() const noexcept { return summaries_; }

    uint64_t getRecordCount() const noexcept;

    /**
     * @brief Metadata as a writer would have recorded it for the file
     */
    FileMetadata metadata(const std::string& relativePath) const;

private:
    std::shared_ptr<arrow::Schema> schema_;
    std::vector<uint8_t> data_;
    std::vector<BatchSummary> summaries_;
    int64_t next_id_ = 0;
    std::string trailing_magic_;
    std::optional<uint64_t> footer_offset_;
};

void appendBigEndian32(std::vector<uint8_t>& out, uint32_t value);

void appendBigEndian64(std::vector<uint8_t>& out, uint64_t value);

void writeBytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes);

/**
 * @brief Footer bytes in the on-disk encoding
 */
std::vector<uint8_t> encodeFooter(const arrow::Schema& schema, const std::vector<BatchSummary>& summaries);

}  // namespace batchfile::test
