#include "storage/file_footer.hpp"
#include <arrow/io/memory.h>
#include <arrow/ipc/dictionary.h>
#include <arrow/ipc/reader.h>
#include <arrow/type.h>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "storage/batch_file_format.hpp"

namespace batchfile {

using namespace format;

uint64_t FileFooter::recordCount() const noexcept {
    uint64_t total = 0;
    for (const auto& batch : batches) {
        total += batch.recordCount;
    }
    return total;
}

FooterContents parseFooter(const std::shared_ptr<arrow::Buffer>& bytes, const std::string& path) {
    const int64_t size = bytes->size();
    const uint8_t* data = bytes->data();

    auto malformed = [&](const std::string& reason, ErrorContext context = {}) {
        context.emplace_back("footer size", std::to_string(size));
        Logger::error("Malformed footer in '{}': {}", path, reason);
        return DataFormatException("Malformed footer: " + reason, path, std::move(context));
    };

    if (size < FOOTER_LENGTH_FIELD_SIZE) {
        throw malformed("missing schema length");
    }
    const int64_t schemaLength = decodeBigEndian32(data);
    int64_t position = FOOTER_LENGTH_FIELD_SIZE;
    if (schemaLength > size - position - FOOTER_LENGTH_FIELD_SIZE) {
        throw malformed("schema length exceeds footer", {{"schema length", std::to_string(schemaLength)}});
    }

    arrow::io::BufferReader schemaReader(arrow::SliceBuffer(bytes, position, schemaLength));
    arrow::ipc::DictionaryMemo dictionaryMemo;
    auto schemaResult = arrow::ipc::ReadSchema(&schemaReader, &dictionaryMemo);
    if (!schemaResult.ok()) {
        throw malformed("unreadable schema", {{"status", schemaResult.status().ToString()}});
    }
    position += schemaLength;

    const int64_t batchCount = decodeBigEndian32(data + position);
    position += FOOTER_LENGTH_FIELD_SIZE;
    if (size - position != batchCount * BATCH_SUMMARY_SIZE) {
        throw malformed("batch list does not match batch count",
                        {{"batch count", std::to_string(batchCount)},
                         {"batch list bytes", std::to_string(size - position)}});
    }

    FooterContents contents;
    contents.schema = std::move(schemaResult).ValueUnsafe();
    contents.footer.batches.reserve(static_cast<size_t>(batchCount));
    for (int64_t i = 0; i < batchCount; ++i) {
        BatchSummary summary;
        summary.offset = decodeBigEndian64(data + position);
        summary.recordCount = decodeBigEndian64(data + position + 8);
        contents.footer.batches.push_back(summary);
        position += BATCH_SUMMARY_SIZE;
    }

    Logger::trace("Parsed footer of '{}': {} batches, {} records", path, batchCount,
                  contents.footer.recordCount());
    return contents;
}

}  // namespace batchfile
