#include "storage/input_stream.hpp"
#include <utility>
#include "common/arrow_status.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace batchfile {

InputStream InputStream::open(arrow::fs::FileSystem& fs, const std::string& path) {
    auto file = valueOrThrow(fs.OpenInputFile(path), path);
    Logger::debug("Opened '{}'", path);
    return InputStream{std::move(file), path};
}

InputStream& InputStream::operator=(InputStream&& other) noexcept {
    if (this != &other) {
        if (file_) {
            auto status = file_->Close();
            if (!status.ok()) {
                Logger::error("Error closing '{}': {}", path_, status.ToString());
            }
        }
        file_ = std::move(other.file_);
        path_ = std::move(other.path_);
    }
    return *this;
}

InputStream::~InputStream() {
    if (!file_)
        return;

    auto status = file_->Close();
    if (!status.ok()) {
        Logger::error("Error closing '{}' during cleanup: {}", path_, status.ToString());
    }
}

void InputStream::seek(int64_t position) {
    throwIfError(file_->Seek(position), path_);
}

void InputStream::readFully(std::span<uint8_t> out) {
    int64_t wanted = static_cast<int64_t>(out.size());
    int64_t got = valueOrThrow(file_->Read(wanted, out.data()), path_);
    if (got != wanted) {
        throw DataFormatException("Unexpected end of file", path_,
                                  {{"expected bytes", std::to_string(wanted)}, {"read bytes", std::to_string(got)}});
    }
}

uint64_t InputStream::readLong(format::ScratchBuffer& scratch) {
    auto bytes = scratch.take(format::FOOTER_OFFSET_SIZE);
    readFully(bytes);
    return format::decodeBigEndian64(bytes.data());
}

std::shared_ptr<arrow::Buffer> InputStream::readBuffer(int64_t nbytes) {
    auto buffer = valueOrThrow(file_->Read(nbytes), path_);
    if (buffer->size() != nbytes) {
        throw DataFormatException("Unexpected end of file", path_,
                                  {{"expected bytes", std::to_string(nbytes)},
                                   {"read bytes", std::to_string(buffer->size())}});
    }
    return buffer;
}

void InputStream::close() {
    if (!file_)
        return;

    // Drop the handle before reporting, so a failed close still releases it.
    auto file = std::move(file_);
    auto status = file->Close();
    Logger::debug("Closed '{}'", path_);
    throwIfError(status, path_);
}

}  // namespace batchfile
