#include "storage/file_metadata.hpp"
#include <arrow/type.h>
#include <optional>
#include <vector>
#include "common/arrow_status.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/types.hpp"
#include "storage/input_stream.hpp"

namespace batchfile {

namespace {

std::optional<std::vector<ColumnMeta>> schemaToColumns(const arrow::Schema& schema) {
    std::vector<ColumnMeta> columns;
    columns.reserve(schema.num_fields());
    for (const auto& field : schema.fields()) {
        auto type = DataType::fromArrow(*field->type());
        if (!type) {
            Logger::warn("Column '{}' has type {} which cannot be stored in metadata, omitting schema",
                         field->name(), field->type()->ToString());
            return std::nullopt;
        }
        columns.push_back(ColumnMeta{field->name(), type->toString(), field->nullable()});
    }
    return columns;
}

}  // namespace

json FileMetadata::to_json() const {
    json obj;
    obj["path"] = path;
    obj["record_count"] = recordCount;
    obj["batches"] = json::array();
    for (const auto& batch : footer.batches)
        obj["batches"].push_back(json{{"offset", batch.offset}, {"record_count", batch.recordCount}});
    if (schema) {
        if (auto columns = schemaToColumns(*schema)) {
            obj["schema"] = json::array();
            for (const auto& c : *columns)
                obj["schema"].push_back(c.to_json());
        }
    }
    return obj;
}

FileMetadata FileMetadata::from_json(const json& obj) {
    FileMetadata metadata;
    try {
        metadata.path = obj.at("path").get<std::string>();
        metadata.recordCount = obj.at("record_count").get<uint64_t>();
        if (obj.contains("batches")) {
            for (const auto& bj : obj.at("batches")) {
                metadata.footer.batches.push_back(
                    BatchSummary{bj.at("offset").get<uint64_t>(), bj.at("record_count").get<uint64_t>()});
            }
        }
        if (obj.contains("schema")) {
            arrow::FieldVector fields;
            for (const auto& cj : obj.at("schema")) {
                ColumnMeta column = ColumnMeta::from_json(cj);
                auto type = DataType::fromString(column.type);
                if (!type) {
                    throw DataFormatException("Unknown column type in file metadata", metadata.path,
                                              {{"column", column.name}, {"type", column.type}});
                }
                fields.push_back(arrow::field(column.name, type->toArrow(), column.nullable));
            }
            metadata.schema = arrow::schema(std::move(fields));
        }
    } catch (const json::exception& e) {
        Logger::error("Error parsing file metadata json: {}", e.what());
        throw DataFormatException(std::string("Invalid file metadata: ") + e.what(), metadata.path);
    }
    return metadata;
}

FooterContents readFooter(InputStream& stream, int64_t fileSize, format::ScratchBuffer& scratch) {
    const uint64_t footerOffset = format::readFooterOffset(stream, fileSize, scratch);
    const int64_t footerEnd = fileSize - format::TRAILER_SIZE;

    stream.seek(static_cast<int64_t>(footerOffset));
    auto bytes = stream.readBuffer(footerEnd - static_cast<int64_t>(footerOffset));
    FooterContents contents = parseFooter(bytes, stream.getPath());
    contents.offset = footerOffset;
    return contents;
}

FileMetadata readFileMetadata(arrow::fs::FileSystem& fs, const std::filesystem::path& basePath,
                              const std::string& relativePath) {
    const std::string path = (basePath / relativePath).string();

    auto info = valueOrThrow(fs.GetFileInfo(path), path);
    if (info.type() != arrow::fs::FileType::File) {
        throw IOException("Not a regular file", path, "IOError");
    }

    InputStream stream = InputStream::open(fs, path);
    format::ScratchBuffer scratch;
    FooterContents contents = readFooter(stream, info.size(), scratch);
    stream.close();

    for (const auto& batch : contents.footer.batches) {
        if (batch.offset < static_cast<uint64_t>(format::MAGIC_STRING_LENGTH) || batch.offset >= contents.offset) {
            Logger::error("Batch offset {} in '{}' lies outside of the data section", batch.offset, path);
            throw DataFormatException("Batch offset outside of data section", path,
                                      {{"offset", std::to_string(batch.offset)},
                                       {"footer offset", std::to_string(contents.offset)}});
        }
    }

    FileMetadata metadata;
    metadata.path = relativePath;
    metadata.recordCount = contents.footer.recordCount();
    metadata.footer = std::move(contents.footer);
    metadata.schema = std::move(contents.schema);

    Logger::debug("Loaded metadata of '{}': {} batches, {} records", path, metadata.footer.batches.size(),
                  metadata.recordCount);
    return metadata;
}

}  // namespace batchfile
