#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>
#include "storage/batch_window.hpp"
#include "storage/file_metadata.hpp"

namespace batchfile {

class DataFileReader {
public:
    virtual ~DataFileReader() = default;

    /**
     * @brief Read the record batches holding rows [start, start + limit) of the file
     * @param start First row to read (0 based)
     * @param limit Number of rows to read
     * @return Windows in file order whose rows concatenate to the requested range. Never empty:
     * when no rows are requested a single zero-row window carrying the file schema is returned.
     */
    virtual std::vector<BatchWindow> read(uint64_t start, uint64_t limit) = 0;

    /**
     * @brief Release the underlying file. Calling it more than once is a no-op.
     */
    virtual void close() = 0;

    virtual std::filesystem::path getPath() const noexcept = 0;

    virtual const FileMetadata& getMetadata() const noexcept = 0;
};

}  // namespace batchfile
