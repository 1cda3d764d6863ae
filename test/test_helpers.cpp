#include "test_helpers.hpp"
#include <arrow/io/memory.h>
#include <arrow/ipc/writer.h>
#include <fstream>
#include <stdexcept>
#include "storage/batch_file_format.hpp"

namespace batchfile::test {

std::shared_ptr<arrow::Schema> testSchema() {
    return arrow::schema({arrow::field("id", arrow::int64(), false), arrow::field("name", arrow::utf8())});
}

std::shared_ptr<arrow::RecordBatch> makeSequenceBatch(int64_t firstId, int64_t count) {
    arrow::Int64Builder ids;
    arrow::StringBuilder names;
    for (int64_t id = firstId; id < firstId + count; ++id) {
        ids.Append(id).Abort();
        names.Append("row-" + std::to_string(id)).Abort();
    }
    auto idArray = ids.Finish().ValueOrDie();
    auto nameArray = names.Finish().ValueOrDie();
    return arrow::RecordBatch::Make(testSchema(), count, {idArray, nameArray});
}

std::vector<int64_t> collectIds(const std::vector<BatchWindow>& windows) {
    std::vector<int64_t> out;
    for (const auto& window : windows) {
        auto rows = window.rows();
        auto ids = std::static_pointer_cast<arrow::Int64Array>(rows->GetColumnByName("id"));
        for (int64_t i = 0; i < ids->length(); ++i) {
            out.push_back(ids->Value(i));
        }
    }
    return out;
}

std::vector<int64_t> idRange(int64_t first, int64_t count) {
    std::vector<int64_t> result;
    result.reserve(count);
    for (int64_t i = 0; i < count; ++i) {
        result.push_back(first + i);
    }
    return result;
}

void appendBigEndian32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void appendBigEndian64(std::vector<uint8_t>& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void writeBytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write test file " + path.string());
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

std::vector<uint8_t> encodeFooter(const arrow::Schema& schema, const std::vector<BatchSummary>& summaries) {
    std::vector<uint8_t> out;
    auto schemaBytes = arrow::ipc::SerializeSchema(schema).ValueOrDie();
    appendBigEndian32(out, static_cast<uint32_t>(schemaBytes->size()));
    out.insert(out.end(), schemaBytes->data(), schemaBytes->data() + schemaBytes->size());
    appendBigEndian32(out, static_cast<uint32_t>(summaries.size()));
    for (const auto& summary : summaries) {
        appendBigEndian64(out, summary.offset);
        appendBigEndian64(out, summary.recordCount);
    }
    return out;
}

BatchFileBuilder::BatchFileBuilder(std::shared_ptr<arrow::Schema> schema)
    : schema_(std::move(schema)), trailing_magic_(format::MAGIC_STRING) {
    data_.insert(data_.end(), format::MAGIC_STRING.begin(), format::MAGIC_STRING.end());
}

BatchFileBuilder& BatchFileBuilder::addBatch(const std::shared_ptr<arrow::RecordBatch>& batch) {
    auto sink = arrow::io::BufferOutputStream::Create().ValueOrDie();
    auto writer = arrow::ipc::MakeStreamWriter(sink, schema_).ValueOrDie();
    writer->WriteRecordBatch(*batch).Abort();
    writer->Close().Abort();
    auto bytes = sink->Finish().ValueOrDie();

    summaries_.push_back(BatchSummary{data_.size(), static_cast<uint64_t>(batch->num_rows())});
    data_.insert(data_.end(), bytes->data(), bytes->data() + bytes->size());
    return *this;
}

BatchFileBuilder& BatchFileBuilder::addSequenceBatches(const std::vector<int64_t>& sizes) {
    for (int64_t size : sizes) {
        addBatch(makeSequenceBatch(next_id_, size));
        next_id_ += size;
    }
    return *this;
}

BatchFileBuilder& BatchFileBuilder::setTrailingMagic(std::string magic) {
    trailing_magic_ = std::move(magic);
    return *this;
}

BatchFileBuilder& BatchFileBuilder::setFooterOffset(uint64_t offset) {
    footer_offset_ = offset;
    return *this;
}

std::vector<uint8_t> BatchFileBuilder::build() const {
    std::vector<uint8_t> out = data_;
    const uint64_t footerOffset = out.size();
    auto footer = encodeFooter(*schema_, summaries_);
    out.insert(out.end(), footer.begin(), footer.end());
    appendBigEndian64(out, footer_offset_.value_or(footerOffset));
    out.insert(out.end(), trailing_magic_.begin(), trailing_magic_.end());
    return out;
}

std::filesystem::path BatchFileBuilder::write(const std::filesystem::path& path) const {
    writeBytes(path, build());
    return path;
}

uint64_t BatchFileBuilder::getRecordCount() const noexcept {
    uint64_t total = 0;
    for (const auto& summary : summaries_) {
        total += summary.recordCount;
    }
    return total;
}

FileMetadata BatchFileBuilder::metadata(const std::string& relativePath) const {
    FileMetadata metadata;
    metadata.path = relativePath;
    metadata.recordCount = getRecordCount();
    metadata.footer.batches = summaries_;
    metadata.schema = schema_;
    return metadata;
}

}  // namespace batchfile::test
