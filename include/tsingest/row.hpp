// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/type_mismatch.hpp"
#include "tsingest/value.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tsingest {

/// Ordered sequence of values, positionally aligned with a TableSchema.
///
/// Alignment with the schema is the producer's contract; Row does not know
/// its schema. Every typed accessor comes in two flavours:
///  - get_T(index): returns std::nullopt when index is out of range or the
///    slot holds Null;
///  - get_T_unchecked(index): identical, but index < size() is a
///    precondition (undefined behavior otherwise). Meant for hot loops that
///    validated the row length once per batch.
/// When the slot holds a different case the current TypeMismatchPolicy
/// decides: throw TypeMismatchError or return std::nullopt.
///
/// take_T moves non-trivial payloads out and leaves Null behind, so a row
/// can be drained into another representation without copies.
class Row {
public:
    Row() = default;

    static Row with_capacity(std::size_t capacity) {
        Row row;
        row.values_.reserve(capacity);
        return row;
    }

    static Row from_values(std::vector<Value> values) {
        Row row;
        row.values_ = std::move(values);
        return row;
    }

    Row& add_value(Value value) & {
        values_.push_back(std::move(value));
        return *this;
    }
    Row&& add_value(Value value) && {
        values_.push_back(std::move(value));
        return std::move(*this);
    }

    Row& add_values(std::vector<Value> values) &;
    Row&& add_values(std::vector<Value> values) &&;

    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const std::vector<Value>& values() const { return values_; }
    const Value& operator[](std::size_t index) const { return values_[index]; }

    std::optional<bool> get_bool(std::size_t index) const;
    std::optional<bool> get_bool_unchecked(std::size_t index) const;

    std::optional<int8_t> get_i8(std::size_t index) const;
    std::optional<int8_t> get_i8_unchecked(std::size_t index) const;
    std::optional<int16_t> get_i16(std::size_t index) const;
    std::optional<int16_t> get_i16_unchecked(std::size_t index) const;
    std::optional<int32_t> get_i32(std::size_t index) const;
    std::optional<int32_t> get_i32_unchecked(std::size_t index) const;
    std::optional<int64_t> get_i64(std::size_t index) const;
    std::optional<int64_t> get_i64_unchecked(std::size_t index) const;

    std::optional<uint8_t> get_u8(std::size_t index) const;
    std::optional<uint8_t> get_u8_unchecked(std::size_t index) const;
    std::optional<uint16_t> get_u16(std::size_t index) const;
    std::optional<uint16_t> get_u16_unchecked(std::size_t index) const;
    std::optional<uint32_t> get_u32(std::size_t index) const;
    std::optional<uint32_t> get_u32_unchecked(std::size_t index) const;
    std::optional<uint64_t> get_u64(std::size_t index) const;
    std::optional<uint64_t> get_u64_unchecked(std::size_t index) const;

    std::optional<float> get_f32(std::size_t index) const;
    std::optional<float> get_f32_unchecked(std::size_t index) const;
    std::optional<double> get_f64(std::size_t index) const;
    std::optional<double> get_f64_unchecked(std::size_t index) const;

    // Binary also accepts String and Json slots and yields their UTF-8 bytes.
    std::optional<Bytes> get_binary(std::size_t index) const;
    std::optional<Bytes> get_binary_unchecked(std::size_t index) const;
    std::optional<Bytes> take_binary(std::size_t index);
    std::optional<Bytes> take_binary_unchecked(std::size_t index);

    std::optional<std::string> get_string(std::size_t index) const;
    std::optional<std::string> get_string_unchecked(std::size_t index) const;
    std::optional<std::string> take_string(std::size_t index);
    std::optional<std::string> take_string_unchecked(std::size_t index);

    std::optional<std::string> get_json(std::size_t index) const;
    std::optional<std::string> get_json_unchecked(std::size_t index) const;
    std::optional<std::string> take_json(std::size_t index);
    std::optional<std::string> take_json_unchecked(std::size_t index);

    // Days since Unix epoch.
    std::optional<int32_t> get_date(std::size_t index) const;
    std::optional<int32_t> get_date_unchecked(std::size_t index) const;
    // Milliseconds since Unix epoch.
    std::optional<int64_t> get_datetime(std::size_t index) const;
    std::optional<int64_t> get_datetime_unchecked(std::size_t index) const;

    // Any timestamp resolution; the raw integer is returned unconverted.
    std::optional<int64_t> get_timestamp(std::size_t index) const;
    std::optional<int64_t> get_timestamp_unchecked(std::size_t index) const;

    // TimeSecond or TimeMillisecond.
    std::optional<int32_t> get_time32(std::size_t index) const;
    std::optional<int32_t> get_time32_unchecked(std::size_t index) const;
    // TimeMicrosecond or TimeNanosecond.
    std::optional<int64_t> get_time64(std::size_t index) const;
    std::optional<int64_t> get_time64_unchecked(std::size_t index) const;

    std::optional<Int128> get_decimal128(std::size_t index) const;
    std::optional<Int128> get_decimal128_unchecked(std::size_t index) const;

    friend bool operator==(const Row& a, const Row& b) { return a.values_ == b.values_; }

private:
    std::vector<Value> values_;
};

}  // namespace tsingest
