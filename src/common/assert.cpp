#include "common/assert.hpp"

#ifndef NDEBUG
#include <source_location>
#include "common/logging.hpp"

namespace batchfile {

void logAssertionFailed(std::string_view condition, const std::source_location& source_location,
                        std::string msg) noexcept {
    Logger::critical("Assertion '{}' in {}:{} in function {} failed!\n Message: {}", condition,
                     source_location.file_name(), source_location.line(),
                     source_location.function_name(), msg);
}
}  // namespace batchfile
#endif
