#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace batchfile {

class InputStream;

namespace format {

// The magic word is written both at the beginning and at the end of the file.
inline constexpr std::string_view MAGIC_STRING = "BATCHFILE1";
inline constexpr int64_t MAGIC_STRING_LENGTH = static_cast<int64_t>(MAGIC_STRING.size());
inline constexpr int64_t FOOTER_OFFSET_SIZE = 8;
inline constexpr int64_t TRAILER_SIZE = MAGIC_STRING_LENGTH + FOOTER_OFFSET_SIZE;
inline constexpr int64_t MIN_FILE_SIZE = 2 * MAGIC_STRING_LENGTH + FOOTER_OFFSET_SIZE;

// Footer layout: [u32 schema length][schema message][u32 batch count][(u64 offset, u64 count)...]
inline constexpr int64_t FOOTER_LENGTH_FIELD_SIZE = 4;
inline constexpr int64_t BATCH_SUMMARY_SIZE = 16;

uint32_t decodeBigEndian32(const uint8_t* bytes) noexcept;
uint64_t decodeBigEndian64(const uint8_t* bytes) noexcept;

/**
 * @brief Reusable byte scratch area for fixed-size reads (integers, magic words). Owned by
 * whoever drives the reads and handed down explicitly, so no per-thread state is involved.
 */
class ScratchBuffer {
public:
    ScratchBuffer() = default;

    /**
     * @brief Returns a view of at least n bytes. Invalidated by the next call.
     */
    std::span<uint8_t> take(size_t n) {
        if (bytes_.size() < n) {
            bytes_.resize(n);
        }
        return {bytes_.data(), n};
    }

private:
    std::vector<uint8_t> bytes_;
};

/**
 * @brief Reads the trailer at the end of the file and validates it:
 * - the file is at least MIN_FILE_SIZE bytes
 * - the trailing magic word matches MAGIC_STRING
 * - MAGIC_STRING_LENGTH <= footer offset < size - TRAILER_SIZE
 * Throws DataFormatException on any violation. Leaves the stream positioned at the end of the file.
 *
 * @return footer offset
 */
uint64_t readFooterOffset(InputStream& stream, int64_t fileSize, ScratchBuffer& scratch);

}  // namespace format
}  // namespace batchfile
