#pragma once

#include <arrow/buffer.h>
#include <arrow/type_fwd.h>
#include <fmt/format.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace batchfile {

/**
 * @brief Location and size of one record batch in the file. A record count of zero marks a
 * logically empty batch that readers skip.
 */
struct BatchSummary {
    uint64_t offset = 0;
    uint64_t recordCount = 0;

    bool operator==(const BatchSummary& other) const noexcept = default;
};

/**
 * @brief Batch summaries in physical file order.
 */
struct FileFooter {
    std::vector<BatchSummary> batches;

    uint64_t recordCount() const noexcept;
};

/**
 * @brief Everything serialized in the footer section of a file.
 */
struct FooterContents {
    std::shared_ptr<arrow::Schema> schema;
    FileFooter footer;
    // byte offset of the footer section, set when read from a file
    uint64_t offset = 0;
};

/**
 * @brief Decodes the footer section. Throws DataFormatException when the bytes are truncated,
 * carry trailing garbage or hold a schema message Arrow cannot read.
 * @param bytes footer bytes, from the footer offset up to the trailer
 * @param path file path used in error reports
 */
FooterContents parseFooter(const std::shared_ptr<arrow::Buffer>& bytes, const std::string& path);

}  // namespace batchfile

template <>
struct fmt::formatter<batchfile::BatchSummary> : fmt::formatter<std::string> {
    auto format(const batchfile::BatchSummary& summary, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(
            fmt::format("BatchSummary(offset={}, records={})", summary.offset, summary.recordCount), ctx);
    }
};
