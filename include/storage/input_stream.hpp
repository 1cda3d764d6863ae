#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include "storage/batch_file_format.hpp"

namespace batchfile {

/**
 * @brief Exclusively owned, seekable handle on an open file. Closed by close() or, on a
 * best-effort basis, by the destructor. Failures surface as IOException, short reads as
 * DataFormatException.
 */
class InputStream {
public:
    static InputStream open(arrow::fs::FileSystem& fs, const std::string& path);

    InputStream(const InputStream&) = delete;
    InputStream& operator=(const InputStream&) = delete;

    InputStream(InputStream&& other) noexcept = default;
    InputStream& operator=(InputStream&& other) noexcept;

    ~InputStream();

    void seek(int64_t position);

    /**
     * @brief Reads exactly out.size() bytes from the current position.
     */
    void readFully(std::span<uint8_t> out);

    /**
     * @brief Reads a big-endian u64 through the given scratch buffer.
     */
    uint64_t readLong(format::ScratchBuffer& scratch);

    /**
     * @brief Reads exactly nbytes from the current position into a freshly allocated buffer.
     */
    std::shared_ptr<arrow::Buffer> readBuffer(int64_t nbytes);

    /**
     * @brief Closes the underlying file. Calling it on an already closed stream is a no-op.
     */
    void close();

    arrow::io::RandomAccessFile& file() noexcept { return *file_; }

    const std::string& getPath() const noexcept { return path_; }

private:
    InputStream(std::shared_ptr<arrow::io::RandomAccessFile> file, std::string path)
        : file_(std::move(file)), path_(std::move(path)) {}

    std::shared_ptr<arrow::io::RandomAccessFile> file_;
    std::string path_;
};

}  // namespace batchfile
