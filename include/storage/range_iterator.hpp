#pragma once

#include <cstdint>
#include <vector>
#include "storage/batch_window.hpp"
#include "storage/data_file_reader.hpp"

namespace batchfile {

/**
 * @brief Pages through rows [start, start + limit) of a file, at most pageSize rows per call
 * to next(). Every page is one read() on the same reader, so the file stays open across pages.
 */
class RangeIterator {
public:
    RangeIterator(DataFileReader& reader, uint64_t start, uint64_t limit, uint64_t pageSize = 4096);

    /**
     * @brief Windows of the next page, empty once the range is exhausted
     */
    std::vector<BatchWindow> next();

    bool hasMore() const noexcept;

    /**
     * @brief Restart from the first row of the range
     */
    void reset() noexcept;

    uint64_t getPosition() const noexcept { return start_ + consumed_; }

private:
    DataFileReader& reader_;
    uint64_t start_;
    uint64_t limit_;
    uint64_t page_size_;
    uint64_t consumed_;
    bool empty_page_returned_;
};

}  // namespace batchfile
