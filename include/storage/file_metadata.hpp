#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/type_fwd.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "storage/batch_file_format.hpp"
#include "storage/file_footer.hpp"

namespace batchfile {

using json = nlohmann::json;

class InputStream;

struct ColumnMeta {
    std::string name;
    std::string type;
    bool nullable = true;

    json to_json() const { return json{{"name", name}, {"type", type}, {"nullable", nullable}}; }

    static ColumnMeta from_json(const json& obj) {
        return ColumnMeta{obj.at("name").get<std::string>(), obj.at("type").get<std::string>(),
                          obj.value("nullable", true)};
    }
};

/**
 * @brief What a reader needs to know about one file before opening it. Produced once when the
 * file is written or loaded, then shared read-only by any number of readers.
 */
struct FileMetadata {
    // relative to the base path readers are given
    std::string path;
    uint64_t recordCount = 0;
    FileFooter footer;
    // may be null, in which case the schema is read from the footer when needed
    std::shared_ptr<arrow::Schema> schema;

    json to_json() const;

    /**
     * @brief Throws DataFormatException on a missing key or an unknown column type.
     */
    static FileMetadata from_json(const json& obj);
};

/**
 * @brief Reads the footer of an open file: trailer, footer offset and footer bytes. Framing is
 * always validated here since the footer bytes are located through it.
 */
FooterContents readFooter(InputStream& stream, int64_t fileSize, format::ScratchBuffer& scratch);

/**
 * @brief Loads the metadata of basePath/relativePath from the file itself.
 */
FileMetadata readFileMetadata(arrow::fs::FileSystem& fs, const std::filesystem::path& basePath,
                              const std::string& relativePath);

}  // namespace batchfile
