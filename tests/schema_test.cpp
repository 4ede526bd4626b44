// SPDX-License-Identifier: MIT

#include "tsingest/schema.hpp"
#include "tsingest/schema_validator.hpp"
#include <gtest/gtest.h>

namespace tsingest {
namespace {

TableSchema valid_schema() {
    return *TableSchema::builder()
        .name("cpu")
        .add_timestamp("ts", DataType::TimestampMillisecond)
        .add_tag("host", DataType::String)
        .add_field("usage", DataType::Float64)
        .build();
}

bool has_issue(const std::vector<SchemaIssue>& issues, std::string_view column,
               std::string_view problem) {
    for (const auto& i : issues) {
        if (i.column == column && i.problem == problem) return true;
    }
    return false;
}

TEST(SchemaTest, BuilderKeepsOrder) {
    auto schema = valid_schema();
    EXPECT_EQ(schema.name(), "cpu");
    ASSERT_EQ(schema.column_count(), 3u);
    EXPECT_EQ(schema.column(0).name, "ts");
    EXPECT_EQ(schema.column(0).semantic_type, SemanticType::Timestamp);
    EXPECT_FALSE(schema.column(0).nullable);
    EXPECT_EQ(schema.column(1).semantic_type, SemanticType::Tag);
    EXPECT_TRUE(schema.column(1).nullable);
    EXPECT_EQ(schema.column(2).semantic_type, SemanticType::Field);
    EXPECT_EQ(schema.column(2).data_type, DataType::Float64);

    auto names = schema.column_names();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "ts");
    EXPECT_EQ(names[2], "usage");
}

TEST(SchemaTest, Find) {
    auto schema = valid_schema();
    EXPECT_EQ(schema.find("host"), 1u);
    EXPECT_FALSE(schema.find("missing").has_value());
}

TEST(SchemaTest, BuildWithoutNameFails) {
    auto r = TableSchema::builder().add_field("v", DataType::Int32).build();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidSchema);
}

TEST(SchemaTest, EmptyTableBuilds) {
    auto r = TableSchema::builder().name("empty").build();
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->column_count(), 0u);
}

TEST(SchemaTest, NonNullableTag) {
    auto schema = *TableSchema::builder()
        .name("t")
        .add_tag("region", DataType::String, false)
        .build();
    EXPECT_FALSE(schema.column(0).nullable);
}

TEST(SchemaTest, Decimal128Field) {
    auto schema = *TableSchema::builder()
        .name("prices")
        .add_decimal128_field("px", 18, 4)
        .build();
    const auto& col = schema.column(0);
    EXPECT_EQ(col.data_type, DataType::Decimal128);
    ASSERT_TRUE(col.decimal.has_value());
    EXPECT_EQ(col.decimal->precision, 18);
    EXPECT_EQ(col.decimal->scale, 4);
}

TEST(SchemaValidatorTest, ValidSchemaHasNoIssues) {
    EXPECT_TRUE(validate_schema(valid_schema()).empty());
}

TEST(SchemaValidatorTest, NoColumns) {
    auto schema = *TableSchema::builder().name("empty").build();
    auto issues = validate_schema(schema);
    EXPECT_TRUE(has_issue(issues, "(table)", "table has no columns"));
    EXPECT_TRUE(has_issue(issues, "(table)", "no timestamp column"));
}

TEST(SchemaValidatorTest, DuplicateName) {
    auto schema = *TableSchema::builder()
        .name("t")
        .add_timestamp("ts", DataType::TimestampSecond)
        .add_field("v", DataType::Int32)
        .add_field("v", DataType::Int64)
        .build();
    auto issues = validate_schema(schema);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].column, "v");
    EXPECT_EQ(issues[0].problem, "duplicate column name");
}

TEST(SchemaValidatorTest, TimestampColumnCount) {
    auto none = *TableSchema::builder().name("t").add_field("v", DataType::Int32).build();
    EXPECT_TRUE(has_issue(validate_schema(none), "(table)", "no timestamp column"));

    auto two = *TableSchema::builder()
        .name("t")
        .add_timestamp("a", DataType::TimestampSecond)
        .add_timestamp("b", DataType::TimestampSecond)
        .build();
    EXPECT_TRUE(has_issue(validate_schema(two), "(table)", "2 timestamp columns"));
}

TEST(SchemaValidatorTest, TimestampColumnWithWrongType) {
    auto schema = *TableSchema::builder()
        .name("t")
        .add_timestamp("ts", DataType::Int64)
        .build();
    EXPECT_TRUE(has_issue(validate_schema(schema), "ts",
                          "timestamp column has non-timestamp type Int64"));
}

TEST(SchemaValidatorTest, DecimalRanges) {
    auto schema = *TableSchema::builder()
        .name("t")
        .add_timestamp("ts", DataType::TimestampSecond)
        .add_decimal128_field("zero", 0, 0)
        .add_decimal128_field("wide", 39, 2)
        .add_decimal128_field("scaled", 10, 11)
        .add_decimal128_field("ok", 38, 38)
        .add_field("bare", DataType::Decimal128)
        .build();
    auto issues = validate_schema(schema);
    EXPECT_EQ(issues.size(), 4u);
    EXPECT_TRUE(has_issue(issues, "zero", "decimal precision 0 out of range [1, 38]"));
    EXPECT_TRUE(has_issue(issues, "wide", "decimal precision 39 out of range [1, 38]"));
    EXPECT_TRUE(has_issue(issues, "scaled", "decimal scale 11 exceeds precision 10"));
    EXPECT_TRUE(has_issue(issues, "bare", "decimal128 column has no precision/scale"));
}

TEST(SchemaValidatorTest, CheckModes) {
    auto bad = *TableSchema::builder().name("t").add_field("v", DataType::Int32).build();

    EXPECT_TRUE(check_schema(bad, SchemaCheck::Off).has_value());
    EXPECT_TRUE(check_schema(bad, SchemaCheck::Warn).has_value());

    auto strict = check_schema(bad, SchemaCheck::Strict);
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().code, ErrorCode::InvalidSchema);
    EXPECT_EQ(strict.error().message, "table 't': (table): no timestamp column");

    EXPECT_TRUE(check_schema(valid_schema(), SchemaCheck::Strict).has_value());
}

}  // namespace
}  // namespace tsingest
