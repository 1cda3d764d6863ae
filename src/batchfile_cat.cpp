#include <arrow/filesystem/localfs.h>
#include <arrow/pretty_print.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "storage/batch_file_reader.hpp"
#include "storage/file_metadata.hpp"

using namespace batchfile;
namespace fs = std::filesystem;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_READ_ERROR = 2;

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <file> [start] [limit] [--validate] [--metadata <json>] [--config <json>]" << std::endl;
}

std::optional<uint64_t> parseCount(const std::string& arg) {
    try {
        size_t consumed = 0;
        unsigned long long value = std::stoull(arg, &consumed);
        if (consumed != arg.size())
            return std::nullopt;
        return static_cast<uint64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

json loadJson(const fs::path& jsonPath) {
    std::ifstream ifs(jsonPath);
    if (!ifs) {
        throw IOException("Cannot open json file", jsonPath.string(), "IOError");
    }
    json root;
    try {
        ifs >> root;
    } catch (const json::exception& e) {
        throw DataFormatException(std::string("Invalid json: ") + e.what(), jsonPath.string());
    }
    return root;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> positional;
    std::optional<fs::path> metadataPath;
    std::optional<fs::path> configPath;
    bool validate = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--validate") {
            validate = true;
        } else if (arg == "--metadata" || arg == "--config") {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return EXIT_USAGE;
            }
            (arg == "--metadata" ? metadataPath : configPath) = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 3) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    fs::path filePath = fs::absolute(positional[0]);
    std::optional<uint64_t> start = positional.size() > 1 ? parseCount(positional[1]) : 0;
    std::optional<uint64_t> limit = positional.size() > 2 ? parseCount(positional[2]) : std::nullopt;
    if (!start || (positional.size() > 2 && !limit)) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    auto localFs = std::make_shared<arrow::fs::LocalFileSystem>();
    try {
        ReaderOptions options = configPath ? ReaderOptions::from_json(loadJson(*configPath)) : ReaderOptions{};
        if (validate)
            options.validateFraming = true;

        FileMetadata metadata = metadataPath
            ? FileMetadata::from_json(loadJson(*metadataPath))
            : readFileMetadata(*localFs, filePath.parent_path(), filePath.filename().string());
        // the sidecar may have been written for another location of the same file
        metadata.path = filePath.filename().string();
        fs::path basePath = filePath.parent_path();

        uint64_t rows = limit ? *limit : (metadata.recordCount > *start ? metadata.recordCount - *start : 0);

        BatchFileReader reader{localFs, basePath, metadata, arrow::default_memory_pool(), options};
        auto windows = reader.read(*start, rows);
        for (const auto& window : windows) {
            std::cout << "-- window [" << window.getStartIndex() << ", " << window.getEndIndex() << ") of "
                      << window.getBatch()->num_rows() << " rows" << std::endl;
            auto status = arrow::PrettyPrint(*window.rows(), 0, &std::cout);
            if (!status.ok()) {
                Logger::error("Cannot print window: {}", status.ToString());
            }
        }
        reader.close();
    } catch (const BatchFileException& e) {
        Logger::error("{}", e.what());
        return EXIT_READ_ERROR;
    }

    return 0;
}
