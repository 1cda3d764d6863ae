#pragma once

#ifdef NDEBUG
#define bf_assert(...) do { } while (0)
#define bf_unreachable(...) __builtin_unreachable()
#else

#include <cstdlib>
#include <format>
#include <source_location>
#include <string>
#include <string_view>

namespace batchfile {

void logAssertionFailed(std::string_view, const std::source_location&,
                                         std::string msg) noexcept;

template <typename... Args>
static void printAssertFailed(std::string_view condition, std::string_view message,
                                        const std::source_location& source_location,
                                        Args&&... args) noexcept {

    std::string formatted_message = std::vformat(message, std::make_format_args(args...));
    logAssertionFailed(condition, source_location, formatted_message);
    std::abort();
}

}  // namespace batchfile

#define bf_assert(cond, msg, ...)                                                                       \
    do {                                                                                                \
        if (!(cond)) {                                                                                  \
            batchfile::printAssertFailed(#cond, (msg), std::source_location::current(), ##__VA_ARGS__); \
        }                                                                                               \
    } while (0)

#define bf_unreachable(msg)                                                                \
    do {                                                                                   \
        batchfile::printAssertFailed("unreachable", msg, std::source_location::current()); \
        __builtin_unreachable();                                                           \
    } while (0)

#endif
