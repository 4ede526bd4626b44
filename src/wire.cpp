// SPDX-License-Identifier: MIT

#include "tsingest/wire.hpp"
#include <fmt/format.h>

namespace tsingest {

namespace wire {

namespace {

template <typename T>
WireValue make(DataType type, T v) {
    WireValue out;
    out.type = type;
    out.data.emplace<T>(std::move(v));
    return out;
}

}  // namespace

WireValue null_value() { return WireValue{}; }
WireValue bool_value(bool v) { return make(DataType::Boolean, v); }
WireValue i8_value(int8_t v) { return make<int32_t>(DataType::Int8, v); }
WireValue i16_value(int16_t v) { return make<int32_t>(DataType::Int16, v); }
WireValue i32_value(int32_t v) { return make(DataType::Int32, v); }
WireValue i64_value(int64_t v) { return make(DataType::Int64, v); }
WireValue u8_value(uint8_t v) { return make<uint32_t>(DataType::Uint8, v); }
WireValue u16_value(uint16_t v) { return make<uint32_t>(DataType::Uint16, v); }
WireValue u32_value(uint32_t v) { return make(DataType::Uint32, v); }
WireValue u64_value(uint64_t v) { return make(DataType::Uint64, v); }
WireValue f32_value(float v) { return make(DataType::Float32, v); }
WireValue f64_value(double v) { return make(DataType::Float64, v); }
WireValue binary_value(Bytes v) { return make(DataType::Binary, std::move(v)); }
WireValue string_value(std::string v) { return make(DataType::String, std::move(v)); }
WireValue json_value(std::string v) { return make(DataType::Json, std::move(v)); }
WireValue date_value(int32_t days) { return make(DataType::Date, days); }
WireValue datetime_value(int64_t ms) { return make(DataType::Datetime, ms); }
WireValue timestamp_second_value(int64_t v) { return make(DataType::TimestampSecond, v); }
WireValue timestamp_millisecond_value(int64_t v) { return make(DataType::TimestampMillisecond, v); }
WireValue timestamp_microsecond_value(int64_t v) { return make(DataType::TimestampMicrosecond, v); }
WireValue timestamp_nanosecond_value(int64_t v) { return make(DataType::TimestampNanosecond, v); }
WireValue time_second_value(int32_t v) { return make(DataType::TimeSecond, v); }
WireValue time_millisecond_value(int32_t v) { return make(DataType::TimeMillisecond, v); }
WireValue time_microsecond_value(int64_t v) { return make(DataType::TimeMicrosecond, v); }
WireValue time_nanosecond_value(int64_t v) { return make(DataType::TimeNanosecond, v); }

WireValue decimal128_value(Int128 v) {
    auto bits = static_cast<unsigned __int128>(v);
    return make(DataType::Decimal128, WireDecimal128{
        .hi = static_cast<int64_t>(bits >> 64),
        .lo = static_cast<uint64_t>(bits),
    });
}

}  // namespace wire

namespace {

template <typename T, typename F>
WireValue or_null(std::optional<T> v, F make) {
    if (!v) return wire::null_value();
    return make(std::move(*v));
}

WireValue convert(Row& row, std::size_t i, DataType type) {
    switch (type) {
        case DataType::Boolean: return or_null(row.get_bool_unchecked(i), wire::bool_value);
        case DataType::Int8: return or_null(row.get_i8_unchecked(i), wire::i8_value);
        case DataType::Int16: return or_null(row.get_i16_unchecked(i), wire::i16_value);
        case DataType::Int32: return or_null(row.get_i32_unchecked(i), wire::i32_value);
        case DataType::Int64: return or_null(row.get_i64_unchecked(i), wire::i64_value);
        case DataType::Uint8: return or_null(row.get_u8_unchecked(i), wire::u8_value);
        case DataType::Uint16: return or_null(row.get_u16_unchecked(i), wire::u16_value);
        case DataType::Uint32: return or_null(row.get_u32_unchecked(i), wire::u32_value);
        case DataType::Uint64: return or_null(row.get_u64_unchecked(i), wire::u64_value);
        case DataType::Float32: return or_null(row.get_f32_unchecked(i), wire::f32_value);
        case DataType::Float64: return or_null(row.get_f64_unchecked(i), wire::f64_value);
        case DataType::Binary: return or_null(row.take_binary_unchecked(i), wire::binary_value);
        case DataType::String: return or_null(row.take_string_unchecked(i), wire::string_value);
        case DataType::Json: return or_null(row.take_json_unchecked(i), wire::json_value);
        case DataType::Date: return or_null(row.get_date_unchecked(i), wire::date_value);
        case DataType::Datetime:
            return or_null(row.get_datetime_unchecked(i), wire::datetime_value);
        case DataType::TimestampSecond:
            return or_null(row.get_timestamp_unchecked(i), wire::timestamp_second_value);
        case DataType::TimestampMillisecond:
            return or_null(row.get_timestamp_unchecked(i), wire::timestamp_millisecond_value);
        case DataType::TimestampMicrosecond:
            return or_null(row.get_timestamp_unchecked(i), wire::timestamp_microsecond_value);
        case DataType::TimestampNanosecond:
            return or_null(row.get_timestamp_unchecked(i), wire::timestamp_nanosecond_value);
        case DataType::TimeSecond:
            return or_null(row.get_time32_unchecked(i), wire::time_second_value);
        case DataType::TimeMillisecond:
            return or_null(row.get_time32_unchecked(i), wire::time_millisecond_value);
        case DataType::TimeMicrosecond:
            return or_null(row.get_time64_unchecked(i), wire::time_microsecond_value);
        case DataType::TimeNanosecond:
            return or_null(row.get_time64_unchecked(i), wire::time_nanosecond_value);
        case DataType::Decimal128:
            return or_null(row.get_decimal128_unchecked(i), wire::decimal128_value);
    }
    return wire::null_value();
}

}  // namespace

std::vector<WireColumnSchema> to_wire_schema(const TableSchema& schema) {
    std::vector<WireColumnSchema> out;
    out.reserve(schema.column_count());
    for (const auto& col : schema.columns()) {
        out.push_back(WireColumnSchema{
            .column_name = col.name,
            .datatype = col.data_type,
            .semantic_type = col.semantic_type,
            .extension = col.decimal,
        });
    }
    return out;
}

Result<WireRow> to_wire_row(Row&& row, const TableSchema& schema) {
    if (row.size() != schema.column_count()) {
        return make_error(ErrorCode::InvalidRow,
            fmt::format("row has {} values, table '{}' has {} columns",
                        row.size(), schema.name(), schema.column_count()));
    }
    WireRow out;
    out.values.reserve(row.size());
    for (std::size_t i = 0; i < row.size(); ++i) {
        out.values.push_back(convert(row, i, schema.column(i).data_type));
    }
    return out;
}

}  // namespace tsingest
