// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/data_type.hpp"
#include "tsingest/error.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsingest {

// Precision and scale of a Decimal128 column.
struct Decimal128Extension {
    uint8_t precision = 38;
    uint8_t scale = 0;
};

struct Column {
    std::string name;
    DataType data_type;
    SemanticType semantic_type;
    bool nullable = true;
    std::optional<Decimal128Extension> decimal;
};

// TableSchema - table name plus ordered columns.
//
// Read-only once built. Shared between the row source and the submission
// engine through SchemaPtr.
class TableSchema {
public:
    class Builder;

    static Builder builder();

    const std::string& name() const { return name_; }
    const std::vector<Column>& columns() const { return columns_; }
    std::size_t column_count() const { return columns_.size(); }
    const Column& column(std::size_t index) const { return columns_[index]; }

    // Index of the first column called `name`.
    std::optional<std::size_t> find(std::string_view name) const;

    std::vector<std::string_view> column_names() const;

private:
    TableSchema(std::string name, std::vector<Column> columns)
        : name_(std::move(name)), columns_(std::move(columns)) {}

    std::string name_;
    std::vector<Column> columns_;
};

using SchemaPtr = std::shared_ptr<const TableSchema>;

// Fluent accumulator for TableSchema.
//
// Columns keep insertion order. The builder does not check column names or
// the number of timestamp columns; see validate_schema() for that.
class TableSchema::Builder {
public:
    Builder& name(std::string name);

    Builder& add_tag(std::string name, DataType type, bool nullable = true);

    // Timestamp columns are never nullable.
    Builder& add_timestamp(std::string name, DataType type);

    Builder& add_field(std::string name, DataType type, bool nullable = true);

    Builder& add_decimal128_field(std::string name, uint8_t precision, uint8_t scale,
                                  bool nullable = true);

    // Fails with InvalidSchema when no table name was given.
    Result<TableSchema> build() const;

private:
    std::optional<std::string> name_;
    std::vector<Column> columns_;
};

}  // namespace tsingest
