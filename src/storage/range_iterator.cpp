#include "storage/range_iterator.hpp"
#include <algorithm>
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace batchfile {

RangeIterator::RangeIterator(DataFileReader& reader, uint64_t start, uint64_t limit, uint64_t pageSize)
    : reader_(reader), start_(start), limit_(limit), page_size_(pageSize), consumed_(0), empty_page_returned_(false) {
    if (pageSize == 0) {
        throw InvalidArgumentException("Page size must be positive", {{"path", reader.getPath().string()}});
    }
}

std::vector<BatchWindow> RangeIterator::next() {
    if (!hasMore()) {
        return {};
    }

    // An empty range still produces one page holding the schema-only window
    if (limit_ == 0) {
        empty_page_returned_ = true;
        return reader_.read(start_, 0);
    }

    const uint64_t pageRows = std::min(page_size_, limit_ - consumed_);
    auto windows = reader_.read(start_ + consumed_, pageRows);
    consumed_ += pageRows;

    Logger::trace("Page of {} rows from '{}', {} of {} consumed", pageRows, reader_.getPath().string(), consumed_,
                  limit_);
    return windows;
}

bool RangeIterator::hasMore() const noexcept {
    if (limit_ == 0) {
        return !empty_page_returned_;
    }
    return consumed_ < limit_;
}

void RangeIterator::reset() noexcept {
    consumed_ = 0;
    empty_page_returned_ = false;
}

}  // namespace batchfile
