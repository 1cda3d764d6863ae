#include "common/logging.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace batchfile {

constexpr const char* logDirectoryVariable = "BATCHFILE_LOG_DIR";

logger_t& getLogger() {
    static auto logger = []() {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        sinks.push_back(console_sink);

        if (const char* dir = std::getenv(logDirectoryVariable); dir != nullptr && *dir != '\0') {
            auto logFile = std::filesystem::path{ dir } / "latest.log";
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile.string(), true);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }

        auto logger = spdlog::logger("batchfile", sinks.begin(), sinks.end());
        logger.set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
        logger.set_level(spdlog::level::trace);
        return logger;
    }();

    return logger;
}

} // namespace batchfile
