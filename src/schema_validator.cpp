// SPDX-License-Identifier: MIT

#include "tsingest/schema_validator.hpp"
#include "tsingest/logging.hpp"
#include <fmt/format.h>
#include <unordered_set>

namespace tsingest {

namespace {

constexpr uint8_t kMaxDecimalPrecision = 38;

}  // namespace

std::vector<SchemaIssue> validate_schema(const TableSchema& schema) {
    std::vector<SchemaIssue> issues;

    if (schema.column_count() == 0) {
        issues.push_back({"(table)", "table has no columns"});
    }

    std::unordered_set<std::string_view> seen;
    std::size_t timestamps = 0;
    for (const auto& col : schema.columns()) {
        if (!seen.insert(col.name).second) {
            issues.push_back({col.name, "duplicate column name"});
        }

        if (col.semantic_type == SemanticType::Timestamp) {
            ++timestamps;
            if (col.nullable) {
                issues.push_back({col.name, "timestamp column is nullable"});
            }
            if (!is_timestamp(col.data_type)) {
                issues.push_back({col.name, fmt::format(
                    "timestamp column has non-timestamp type {}",
                    data_type_name(col.data_type))});
            }
        }

        if (col.data_type == DataType::Decimal128) {
            if (!col.decimal) {
                issues.push_back({col.name, "decimal128 column has no precision/scale"});
            } else if (col.decimal->precision < 1 ||
                       col.decimal->precision > kMaxDecimalPrecision) {
                issues.push_back({col.name, fmt::format(
                    "decimal precision {} out of range [1, {}]",
                    col.decimal->precision, kMaxDecimalPrecision)});
            } else if (col.decimal->scale > col.decimal->precision) {
                issues.push_back({col.name, fmt::format(
                    "decimal scale {} exceeds precision {}",
                    col.decimal->scale, col.decimal->precision)});
            }
        }
    }

    if (timestamps == 0) {
        issues.push_back({"(table)", "no timestamp column"});
    } else if (timestamps > 1) {
        issues.push_back({"(table)", fmt::format("{} timestamp columns", timestamps)});
    }

    return issues;
}

Result<void> check_schema(const TableSchema& schema, SchemaCheck mode) {
    if (mode == SchemaCheck::Off) return {};

    auto issues = validate_schema(schema);
    if (issues.empty()) return {};

    if (mode == SchemaCheck::Strict) {
        const auto& first = issues.front();
        return make_error(ErrorCode::InvalidSchema,
            fmt::format("table '{}': {}: {}", schema.name(), first.column, first.problem));
    }

    for (const auto& issue : issues) {
        log()->warn("schema '{}': {}: {}", schema.name(), issue.column, issue.problem);
    }
    return {};
}

}  // namespace tsingest
