// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/data_type.hpp"
#include "tsingest/error.hpp"
#include "tsingest/row.hpp"
#include "tsingest/schema.hpp"
#include "tsingest/value.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tsingest {

// 128-bit decimal split into two 64-bit halves.
struct WireDecimal128 {
    int64_t hi = 0;
    uint64_t lo = 0;

    friend bool operator==(const WireDecimal128&, const WireDecimal128&) = default;
};

// Row-insert message value. Mirrors the remote store's protobuf oneof:
// Int8/Int16 travel as int32, Uint8/Uint16 as uint32, and a value without
// data is Null.
struct WireValue {
    using Data = std::variant<std::monostate, bool, int32_t, int64_t, uint32_t, uint64_t,
                              float, double, std::string, Bytes, WireDecimal128>;

    DataType type = DataType::Boolean;  // meaningless when data is empty
    Data data;

    bool is_null() const { return std::holds_alternative<std::monostate>(data); }

    friend bool operator==(const WireValue& a, const WireValue& b) {
        if (a.is_null() || b.is_null()) return a.is_null() == b.is_null();
        return a.type == b.type && a.data == b.data;
    }
};

struct WireRow {
    std::vector<WireValue> values;
};

struct WireColumnSchema {
    std::string column_name;
    DataType datatype;
    SemanticType semantic_type;
    std::optional<Decimal128Extension> extension;
};

struct InsertRequest {
    std::string table_name;
    std::vector<WireColumnSchema> schema;
    std::vector<WireRow> rows;
};

namespace wire {

WireValue null_value();
WireValue bool_value(bool v);
WireValue i8_value(int8_t v);
WireValue i16_value(int16_t v);
WireValue i32_value(int32_t v);
WireValue i64_value(int64_t v);
WireValue u8_value(uint8_t v);
WireValue u16_value(uint16_t v);
WireValue u32_value(uint32_t v);
WireValue u64_value(uint64_t v);
WireValue f32_value(float v);
WireValue f64_value(double v);
WireValue binary_value(Bytes v);
WireValue string_value(std::string v);
WireValue json_value(std::string v);
WireValue date_value(int32_t days);
WireValue datetime_value(int64_t ms);
WireValue timestamp_second_value(int64_t v);
WireValue timestamp_millisecond_value(int64_t v);
WireValue timestamp_microsecond_value(int64_t v);
WireValue timestamp_nanosecond_value(int64_t v);
WireValue time_second_value(int32_t v);
WireValue time_millisecond_value(int32_t v);
WireValue time_microsecond_value(int64_t v);
WireValue time_nanosecond_value(int64_t v);
WireValue decimal128_value(Int128 v);

}  // namespace wire

std::vector<WireColumnSchema> to_wire_schema(const TableSchema& schema);

// Converts `row` column by column according to `schema`, draining string,
// binary and json payloads with the take accessors. Fails with InvalidRow
// when the row length differs from the column count.
Result<WireRow> to_wire_row(Row&& row, const TableSchema& schema);

}  // namespace tsingest
