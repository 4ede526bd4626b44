// SPDX-License-Identifier: MIT

#include "tsingest/wire.hpp"
#include <gtest/gtest.h>

namespace tsingest {
namespace {

TableSchema sensor_schema() {
    return *TableSchema::builder()
        .name("sensors")
        .add_timestamp("ts", DataType::TimestampNanosecond)
        .add_tag("device", DataType::String)
        .add_field("level", DataType::Int8)
        .add_field("flags", DataType::Uint16)
        .add_field("reading", DataType::Float64)
        .add_field("payload", DataType::Binary)
        .add_decimal128_field("price", 20, 2)
        .build();
}

TEST(WireTest, SmallIntegersWiden) {
    auto v = wire::i8_value(-7);
    EXPECT_EQ(v.type, DataType::Int8);
    ASSERT_TRUE(std::holds_alternative<int32_t>(v.data));
    EXPECT_EQ(std::get<int32_t>(v.data), -7);

    auto u = wire::u16_value(65535);
    EXPECT_EQ(u.type, DataType::Uint16);
    ASSERT_TRUE(std::holds_alternative<uint32_t>(u.data));
    EXPECT_EQ(std::get<uint32_t>(u.data), 65535u);
}

TEST(WireTest, Decimal128Halves) {
    Int128 v = (static_cast<Int128>(3) << 64) | 5;
    auto w = wire::decimal128_value(v);
    ASSERT_TRUE(std::holds_alternative<WireDecimal128>(w.data));
    EXPECT_EQ(std::get<WireDecimal128>(w.data), (WireDecimal128{3, 5}));

    auto neg = wire::decimal128_value(-1);
    EXPECT_EQ(std::get<WireDecimal128>(neg.data), (WireDecimal128{-1, ~0ULL}));
}

TEST(WireTest, NullEquality) {
    EXPECT_TRUE(wire::null_value().is_null());
    EXPECT_EQ(wire::null_value(), wire::null_value());
    EXPECT_NE(wire::null_value(), wire::i32_value(0));
    // Same payload, different case
    EXPECT_NE(wire::timestamp_second_value(1), wire::timestamp_millisecond_value(1));
}

TEST(WireTest, Schema) {
    auto cols = to_wire_schema(sensor_schema());
    ASSERT_EQ(cols.size(), 7u);
    EXPECT_EQ(cols[0].column_name, "ts");
    EXPECT_EQ(cols[0].semantic_type, SemanticType::Timestamp);
    EXPECT_EQ(cols[1].semantic_type, SemanticType::Tag);
    EXPECT_EQ(cols[2].datatype, DataType::Int8);
    EXPECT_FALSE(cols[2].extension.has_value());
    ASSERT_TRUE(cols[6].extension.has_value());
    EXPECT_EQ(cols[6].extension->precision, 20);
    EXPECT_EQ(cols[6].extension->scale, 2);
}

TEST(WireTest, RowConversion) {
    auto schema = sensor_schema();
    auto row = Row::from_values({
        Value::timestamp_nanosecond(1'000'000'123),
        Value::string("dev-1"),
        Value::int8(-3),
        Value::null(),
        Value::float64(0.5),
        Value::binary({1, 2}),
        Value::decimal128(12345),
    });
    auto r = to_wire_row(std::move(row), schema);
    ASSERT_TRUE(r.has_value());
    const auto& v = r->values;
    ASSERT_EQ(v.size(), 7u);
    EXPECT_EQ(v[0], wire::timestamp_nanosecond_value(1'000'000'123));
    EXPECT_EQ(v[1], wire::string_value("dev-1"));
    EXPECT_EQ(v[2], wire::i8_value(-3));
    EXPECT_TRUE(v[3].is_null());
    EXPECT_EQ(v[4], wire::f64_value(0.5));
    EXPECT_EQ(v[5], wire::binary_value({1, 2}));
    EXPECT_EQ(v[6], wire::decimal128_value(12345));
}

TEST(WireTest, StringIntoBinaryColumn) {
    auto schema = *TableSchema::builder()
        .name("blobs")
        .add_field("data", DataType::Binary)
        .build();
    auto r = to_wire_row(Row::from_values({Value::string("hi")}), schema);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->values[0], wire::binary_value({'h', 'i'}));
}

TEST(WireTest, LengthMismatch) {
    auto r = to_wire_row(Row::from_values({Value::int32(1)}), sensor_schema());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidRow);
    EXPECT_EQ(r.error().message, "row has 1 values, table 'sensors' has 7 columns");
}

TEST(WireTest, MismatchedValueBecomesNullWhenLenient) {
    ScopedTypeMismatchPolicy policy(TypeMismatchPolicy::ReturnEmpty);
    auto schema = *TableSchema::builder()
        .name("t")
        .add_field("n", DataType::Int64)
        .build();
    auto r = to_wire_row(Row::from_values({Value::string("oops")}), schema);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->values[0].is_null());
}

TEST(WireTest, MismatchedValueThrowsWhenStrict) {
    ScopedTypeMismatchPolicy policy(TypeMismatchPolicy::Throw);
    auto schema = *TableSchema::builder()
        .name("t")
        .add_field("n", DataType::Int64)
        .build();
    EXPECT_THROW((void)to_wire_row(Row::from_values({Value::string("oops")}), schema),
                 TypeMismatchError);
}

}  // namespace
}  // namespace tsingest
