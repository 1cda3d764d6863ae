#pragma once

#include <nlohmann/json.hpp>

namespace batchfile {

struct ReaderOptions {
    // Check the trailer (magic word and footer offset bounds) when the file is opened
    bool validateFraming = false;
    // Fail when a decoded batch holds a different number of rows than its footer entry
    bool verifyRowCounts = true;

    static ReaderOptions from_json(const nlohmann::json& obj) {
        ReaderOptions options;
        options.validateFraming = obj.value("validate_framing", options.validateFraming);
        options.verifyRowCounts = obj.value("verify_row_counts", options.verifyRowCounts);
        return options;
    }
};

}  // namespace batchfile
