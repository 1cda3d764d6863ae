#pragma once

#include <arrow/record_batch.h>
#include <cstdint>
#include <memory>
#include <utility>
#include "common/assert.hpp"

namespace batchfile {

/**
 * @brief A decoded record batch together with the rows [startIndex, endIndex) of it that belong
 * to a requested range. The window is the only owner of the decoded batch until the caller
 * releases it.
 */
class BatchWindow {
public:
    BatchWindow(std::shared_ptr<arrow::RecordBatch> batch, int64_t startIndex, int64_t endIndex)
        : batch_(std::move(batch)), start_index_(startIndex), end_index_(endIndex) {
        bf_assert(batch_ != nullptr, "BatchWindow requires a decoded batch");
        bf_assert(0 <= start_index_ && start_index_ <= end_index_ && end_index_ <= batch_->num_rows(),
                  "Window [{}, {}) out of bounds for batch of {} rows", start_index_, end_index_,
                  batch_->num_rows());
    }

    BatchWindow(const BatchWindow&) = delete;
    BatchWindow& operator=(const BatchWindow&) = delete;

    BatchWindow(BatchWindow&&) noexcept = default;
    BatchWindow& operator=(BatchWindow&&) noexcept = default;

    int64_t getStartIndex() const noexcept { return start_index_; }

    int64_t getEndIndex() const noexcept { return end_index_; }

    int64_t size() const noexcept { return end_index_ - start_index_; }

    const std::shared_ptr<arrow::RecordBatch>& getBatch() const noexcept { return batch_; }

    std::shared_ptr<arrow::Schema> schema() const { return batch_->schema(); }

    int numColumns() const { return batch_->num_columns(); }

    /**
     * @brief Zero-copy view of just the rows inside the window.
     */
    std::shared_ptr<arrow::RecordBatch> rows() const { return batch_->Slice(start_index_, size()); }

    /**
     * @brief Hands the decoded batch over to the caller. The window is empty afterwards.
     */
    std::shared_ptr<arrow::RecordBatch> releaseBatch() noexcept {
        start_index_ = end_index_ = 0;
        return std::move(batch_);
    }

private:
    std::shared_ptr<arrow::RecordBatch> batch_;
    int64_t start_index_;
    int64_t end_index_;
};

}  // namespace batchfile
