#include "storage/batch_file_format.hpp"
#include <algorithm>
#include <string>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "storage/input_stream.hpp"

namespace batchfile::format {

uint32_t decodeBigEndian32(const uint8_t* bytes) noexcept {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

uint64_t decodeBigEndian64(const uint8_t* bytes) noexcept {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

uint64_t readFooterOffset(InputStream& stream, int64_t fileSize, ScratchBuffer& scratch) {
    const std::string& path = stream.getPath();

    if (fileSize < MIN_FILE_SIZE) {
        Logger::error("File '{}' is too small ({} bytes) to be a batch file", path, fileSize);
        throw DataFormatException("File is too small to be a batch file", path,
                                  {{"size", std::to_string(fileSize)}});
    }

    stream.seek(fileSize - TRAILER_SIZE);
    const uint64_t footerOffset = stream.readLong(scratch);

    auto magic = scratch.take(MAGIC_STRING_LENGTH);
    stream.readFully(magic);
    if (!std::equal(magic.begin(), magic.end(), MAGIC_STRING.begin(), MAGIC_STRING.end(),
                    [](uint8_t a, char b) { return a == static_cast<uint8_t>(b); })) {
        Logger::error("Invalid magic word in '{}'", path);
        throw DataFormatException("Invalid magic word. File is not a batch file", path);
    }

    if (footerOffset < static_cast<uint64_t>(MAGIC_STRING_LENGTH) ||
        footerOffset >= static_cast<uint64_t>(fileSize - TRAILER_SIZE)) {
        Logger::error("Invalid footer offset {} in '{}' of size {}", footerOffset, path, fileSize);
        throw DataFormatException("Invalid footer offset", path,
                                  {{"invalid footer offset", std::to_string(footerOffset)},
                                   {"size", std::to_string(fileSize)}});
    }

    return footerOffset;
}

}  // namespace batchfile::format
