// SPDX-License-Identifier: MIT

#include "tsingest/schema.hpp"

namespace tsingest {

TableSchema::Builder TableSchema::builder() {
    return Builder{};
}

std::optional<std::size_t> TableSchema::find(std::string_view name) const {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return i;
    }
    return std::nullopt;
}

std::vector<std::string_view> TableSchema::column_names() const {
    std::vector<std::string_view> names;
    names.reserve(columns_.size());
    for (const auto& c : columns_) {
        names.push_back(c.name);
    }
    return names;
}

TableSchema::Builder& TableSchema::Builder::name(std::string name) {
    name_ = std::move(name);
    return *this;
}

TableSchema::Builder& TableSchema::Builder::add_tag(std::string name, DataType type,
                                                    bool nullable) {
    columns_.push_back(Column{
        .name = std::move(name),
        .data_type = type,
        .semantic_type = SemanticType::Tag,
        .nullable = nullable,
    });
    return *this;
}

TableSchema::Builder& TableSchema::Builder::add_timestamp(std::string name, DataType type) {
    columns_.push_back(Column{
        .name = std::move(name),
        .data_type = type,
        .semantic_type = SemanticType::Timestamp,
        .nullable = false,
    });
    return *this;
}

TableSchema::Builder& TableSchema::Builder::add_field(std::string name, DataType type,
                                                      bool nullable) {
    columns_.push_back(Column{
        .name = std::move(name),
        .data_type = type,
        .semantic_type = SemanticType::Field,
        .nullable = nullable,
    });
    return *this;
}

TableSchema::Builder& TableSchema::Builder::add_decimal128_field(std::string name,
                                                                 uint8_t precision,
                                                                 uint8_t scale,
                                                                 bool nullable) {
    columns_.push_back(Column{
        .name = std::move(name),
        .data_type = DataType::Decimal128,
        .semantic_type = SemanticType::Field,
        .nullable = nullable,
        .decimal = Decimal128Extension{precision, scale},
    });
    return *this;
}

Result<TableSchema> TableSchema::Builder::build() const {
    if (!name_) {
        return make_error(ErrorCode::InvalidSchema, "table schema is missing a name");
    }
    return TableSchema{*name_, columns_};
}

}  // namespace tsingest
