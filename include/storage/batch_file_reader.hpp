#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/memory_pool.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>
#include "storage/batch_file_format.hpp"
#include "storage/batch_window.hpp"
#include "storage/data_file_reader.hpp"
#include "storage/file_metadata.hpp"
#include "storage/input_stream.hpp"
#include "storage/reader_options.hpp"

namespace batchfile {

/**
 * @brief Random-access reader for batch files. Decodes only the record batches that overlap a
 * requested row range and trims the first and last of them to the exact row boundaries.
 *
 * The file is opened lazily on the first read and stays open for later reads until close().
 * One instance owns one stream and must not be used from several threads at once; use one
 * reader per thread for parallel range reads. The metadata is borrowed and must outlive the reader.
 */
class BatchFileReader : public DataFileReader {
public:
    BatchFileReader(std::shared_ptr<arrow::fs::FileSystem> fs, const std::filesystem::path& basePath,
                    const FileMetadata& metadata, arrow::MemoryPool* pool = arrow::default_memory_pool(),
                    ReaderOptions options = {});

    BatchFileReader(const BatchFileReader&) = delete;
    BatchFileReader& operator=(const BatchFileReader&) = delete;

    ~BatchFileReader() override;

    /**
     * @brief Throws InvalidArgumentException before touching the file when the range does not fit
     * the metadata record count, DataFormatException for a corrupt file, IOException when the
     * filesystem fails and IllegalStateException after close(). Nothing is returned on failure.
     */
    std::vector<BatchWindow> read(uint64_t start, uint64_t limit) override;

    void close() override;

    std::filesystem::path getPath() const noexcept override { return path_; }

    const FileMetadata& getMetadata() const noexcept override { return metadata_; }

    const ReaderOptions& getOptions() const noexcept { return options_; }

    bool isOpen() const noexcept { return state_ == State::OPEN; }

    bool isClosed() const noexcept { return state_ == State::CLOSED; }

private:
    enum class State { UNOPENED, OPEN, CLOSED };

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    const FileMetadata& metadata_;
    arrow::MemoryPool* pool_;
    ReaderOptions options_;
    std::filesystem::path path_;

    State state_;
    std::optional<InputStream> stream_;
    format::ScratchBuffer scratch_;

    void checkRange(uint64_t start, uint64_t limit) const;

    void openFile();

    int64_t getFileSize();

    std::shared_ptr<arrow::RecordBatch> decodeBatchAt(const BatchSummary& summary);

    /**
     * @brief Zero-row window with the columns of the file schema.
     */
    BatchWindow getEmptyBatch();
};

}  // namespace batchfile
