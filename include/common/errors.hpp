#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace batchfile {

using ErrorContext = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Base class of every error raised while reading a batch file. Carries the
 * resolved file path (when known) and key/value context, both rendered into what().
 */
class BatchFileException : public std::runtime_error {
   public:
    explicit BatchFileException(const std::string& message, std::optional<std::string> path = std::nullopt,
                                ErrorContext context = {})
        : std::runtime_error(render(message, path, context)),
          message_(message),
          path_(std::move(path)),
          context_(std::move(context)) {}

    const std::string& getMessage() const noexcept { return message_; }

    const std::optional<std::string>& getPath() const noexcept { return path_; }

    const ErrorContext& getContext() const noexcept { return context_; }

   private:
    std::string message_;
    std::optional<std::string> path_;
    ErrorContext context_;

    static std::string render(const std::string& message, const std::optional<std::string>& path,
                              const ErrorContext& context) {
        std::string out = message;
        if (path)
            out += " [path: " + *path + "]";
        for (const auto& [key, value] : context)
            out += " [" + key + ": " + value + "]";
        return out;
    }
};

/**
 * @brief Requested row range does not fit the file. Caller bug, never retried.
 */
class InvalidArgumentException : public BatchFileException {
   public:
    explicit InvalidArgumentException(const std::string& message, ErrorContext context = {})
        : BatchFileException(message, std::nullopt, std::move(context)) {}
};

/**
 * @brief The file is not a well-formed batch file (bad magic, truncated, bad offsets,
 * malformed footer or batch).
 */
class DataFormatException : public BatchFileException {
   public:
    DataFormatException(const std::string& message, std::string path, ErrorContext context = {})
        : BatchFileException(message, std::move(path), std::move(context)) {}
};

/**
 * @brief Failure of the underlying filesystem or stream.
 */
class IOException : public BatchFileException {
   public:
    IOException(const std::string& message, std::optional<std::string> path, std::string statusCode)
        : BatchFileException(message, std::move(path), {{"status", statusCode}}),
          status_code_(std::move(statusCode)) {}

    const std::string& getStatusCode() const noexcept { return status_code_; }

   private:
    std::string status_code_;
};

class IllegalStateException : public BatchFileException {
   public:
    IllegalStateException(const std::string& message, std::string path)
        : BatchFileException(message, std::move(path)) {}
};

}  // namespace batchfile
