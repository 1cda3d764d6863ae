#include "common/types.hpp"
#include <arrow/type.h>
#include "common/assert.hpp"

namespace batchfile {

std::string DataType::toString() const noexcept {
    switch (type_) {
        case Type::INT32:
            return "INT32";
        case Type::INT64:
            return "INT64";
        case Type::DOUBLE:
            return "DOUBLE";
        case Type::BOOL:
            return "BOOL";
        case Type::STRING:
            return "STRING";
        default:
            return "UNKNOWN";
    }
}

std::optional<DataType> DataType::fromString(const std::string& typeStr) noexcept {
    if (typeStr == "INT32") {
        return DataType::getInt32();
    } else if (typeStr == "INT64") {
        return DataType::getInt64();
    } else if (typeStr == "DOUBLE") {
        return DataType::getDouble();
    } else if (typeStr == "BOOL") {
        return DataType::getBool();
    } else if (typeStr == "STRING") {
        return DataType::getString();
    } else {
        return std::nullopt;
    }
}

std::shared_ptr<arrow::DataType> DataType::toArrow() const {
    switch (type_) {
        case Type::INT32:
            return arrow::int32();
        case Type::INT64:
            return arrow::int64();
        case Type::DOUBLE:
            return arrow::float64();
        case Type::BOOL:
            return arrow::boolean();
        case Type::STRING:
            return arrow::utf8();
        default:
            bf_unreachable("Invalid data type");
    }
}

std::optional<DataType> DataType::fromArrow(const arrow::DataType& type) noexcept {
    switch (type.id()) {
        case arrow::Type::INT32:
            return DataType::getInt32();
        case arrow::Type::INT64:
            return DataType::getInt64();
        case arrow::Type::DOUBLE:
            return DataType::getDouble();
        case arrow::Type::BOOL:
            return DataType::getBool();
        case arrow::Type::STRING:
            return DataType::getString();
        default:
            return std::nullopt;
    }
}

}  // namespace batchfile
