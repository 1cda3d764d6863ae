#pragma once

#include <arrow/type_fwd.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace batchfile {

/**
 * @brief Column types that can be named in persisted file metadata. Files themselves may
 * hold any Arrow type; only these survive a round trip through JSON.
 */
class DataType {

   public:
    enum Type { INT32, INT64, DOUBLE, BOOL, STRING };

    explicit DataType(Type t) : type_(t) {}

    static DataType getInt32() noexcept { return DataType{Type::INT32}; }

    static DataType getInt64() noexcept { return DataType{Type::INT64}; }

    static DataType getDouble() noexcept { return DataType{Type::DOUBLE}; }

    static DataType getBool() noexcept { return DataType{Type::BOOL}; }

    static DataType getString() noexcept { return DataType{Type::STRING}; }

    Type getType() const noexcept { return type_; }

    std::string toString() const noexcept;

    static std::optional<DataType> fromString(const std::string& typeStr) noexcept;

    std::shared_ptr<arrow::DataType> toArrow() const;

    // nullopt for Arrow types without a metadata name
    static std::optional<DataType> fromArrow(const arrow::DataType& type) noexcept;

    bool operator==(const DataType& other) const noexcept { return type_ == other.type_; }

    bool operator!=(const DataType& other) const noexcept { return type_ != other.type_; }

   private:
    Type type_;
};

}  // namespace batchfile
