// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/data_type.hpp"
#include <fmt/format.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tsingest {

using Int128 = __int128;
using Bytes = std::vector<uint8_t>;

// Value - one case per DataType plus Null.
//
// The case (type()) determines the semantic type exactly. Several cases share
// a C++ representation (all timestamps are int64_t, String and Json are
// std::string), so the DataType tag is stored next to the payload. Values are
// only built through the named constructors, which keeps tag and payload in
// sync.
class Value {
public:
    using Storage = std::variant<std::monostate, bool,
                                 int8_t, int16_t, int32_t, int64_t,
                                 uint8_t, uint16_t, uint32_t, uint64_t,
                                 float, double, Int128,
                                 std::string, Bytes>;

    Value() = default;

    static Value null() { return Value{}; }

    static Value boolean(bool v) { return {DataType::Boolean, v}; }
    static Value int8(int8_t v) { return {DataType::Int8, v}; }
    static Value int16(int16_t v) { return {DataType::Int16, v}; }
    static Value int32(int32_t v) { return {DataType::Int32, v}; }
    static Value int64(int64_t v) { return {DataType::Int64, v}; }
    static Value uint8(uint8_t v) { return {DataType::Uint8, v}; }
    static Value uint16(uint16_t v) { return {DataType::Uint16, v}; }
    static Value uint32(uint32_t v) { return {DataType::Uint32, v}; }
    static Value uint64(uint64_t v) { return {DataType::Uint64, v}; }
    static Value float32(float v) { return {DataType::Float32, v}; }
    static Value float64(double v) { return {DataType::Float64, v}; }
    static Value binary(Bytes v) { return {DataType::Binary, std::move(v)}; }
    static Value string(std::string v) { return {DataType::String, std::move(v)}; }
    static Value date(int32_t days) { return {DataType::Date, days}; }
    static Value datetime(int64_t ms) { return {DataType::Datetime, ms}; }
    static Value timestamp_second(int64_t v) { return {DataType::TimestampSecond, v}; }
    static Value timestamp_millisecond(int64_t v) { return {DataType::TimestampMillisecond, v}; }
    static Value timestamp_microsecond(int64_t v) { return {DataType::TimestampMicrosecond, v}; }
    static Value timestamp_nanosecond(int64_t v) { return {DataType::TimestampNanosecond, v}; }
    static Value time_second(int32_t v) { return {DataType::TimeSecond, v}; }
    static Value time_millisecond(int32_t v) { return {DataType::TimeMillisecond, v}; }
    static Value time_microsecond(int64_t v) { return {DataType::TimeMicrosecond, v}; }
    static Value time_nanosecond(int64_t v) { return {DataType::TimeNanosecond, v}; }
    static Value decimal128(Int128 v) { return {DataType::Decimal128, v}; }
    static Value json(std::string v) { return {DataType::Json, std::move(v)}; }

    bool is_null() const { return std::holds_alternative<std::monostate>(data_); }

    // Stored case. Only meaningful when !is_null().
    DataType type() const { return type_; }

    template <typename T>
    const T& as() const { return std::get<T>(data_); }

    template <typename T>
    T& as() { return std::get<T>(data_); }

    const Storage& storage() const { return data_; }

    // Approximate payload size in bytes, used to size batch buffers.
    std::size_t estimated_size() const;

    friend bool operator==(const Value& a, const Value& b) {
        if (a.is_null() || b.is_null()) return a.is_null() == b.is_null();
        return a.type_ == b.type_ && a.data_ == b.data_;
    }

private:
    template <typename T>
    Value(DataType type, T v)
        : type_(type), data_(std::in_place_type<T>, std::move(v)) {}

    DataType type_ = DataType::Boolean;
    Storage data_;
};

// Render a value as "<Case>(<payload>)", e.g. Int32(42), String("test"), Null.
std::string to_string(const Value& value);

}  // namespace tsingest

template <>
struct fmt::formatter<tsingest::Value> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tsingest::Value& v, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(tsingest::to_string(v), ctx);
    }
};
