#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <optional>
#include <string>
#include <utility>
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace batchfile {

/**
 * @brief Converts a failed Arrow status into an IOException. Invalid/IOError/etc. from the
 * stream layer all surface as IOException; format problems are detected by the callers.
 */
inline void throwIfError(const arrow::Status& status, const std::optional<std::string>& path = std::nullopt) {
    if (status.ok())
        return;
    Logger::debug("Arrow call failed for '{}': {}", path.value_or("<none>"), status.ToString());
    throw IOException(status.message(), path, status.CodeAsString());
}

template <typename T>
T valueOrThrow(arrow::Result<T>&& result, const std::optional<std::string>& path = std::nullopt) {
    throwIfError(result.status(), path);
    return std::move(result).ValueUnsafe();
}

}  // namespace batchfile
