// SPDX-License-Identifier: MIT

#include "tsingest/row.hpp"
#include <iterator>

namespace tsingest {

namespace {

template <typename T>
std::optional<T> type_mismatch(std::size_t index, std::string_view expected,
                               const Value& actual) {
    if (type_mismatch_policy() == TypeMismatchPolicy::Throw) {
        throw TypeMismatchError(index, expected, actual);
    }
    return std::nullopt;
}

template <DataType... Accepted>
bool holds(const Value& v) {
    return ((v.type() == Accepted) || ...);
}

// The single matching routine behind every get_T / get_T_unchecked pair.
template <typename T, DataType... Accepted>
std::optional<T> read(const Value& v, std::size_t index, std::string_view expected) {
    if (v.is_null()) return std::nullopt;
    if (holds<Accepted...>(v)) return v.as<T>();
    return type_mismatch<T>(index, expected, v);
}

template <typename T, DataType... Accepted>
std::optional<T> take(Value& v, std::size_t index, std::string_view expected) {
    if (v.is_null()) return std::nullopt;
    if (holds<Accepted...>(v)) {
        T out = std::move(v.as<T>());
        v = Value::null();
        return out;
    }
    return type_mismatch<T>(index, expected, v);
}

Bytes text_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

}  // namespace

Row& Row::add_values(std::vector<Value> values) & {
    values_.insert(values_.end(), std::make_move_iterator(values.begin()),
                   std::make_move_iterator(values.end()));
    return *this;
}

Row&& Row::add_values(std::vector<Value> values) && {
    add_values(std::move(values));
    return std::move(*this);
}

std::optional<bool> Row::get_bool(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_bool_unchecked(index);
}

std::optional<bool> Row::get_bool_unchecked(std::size_t index) const {
    return read<bool, DataType::Boolean>(values_[index], index, "boolean");
}

std::optional<int8_t> Row::get_i8(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_i8_unchecked(index);
}

std::optional<int8_t> Row::get_i8_unchecked(std::size_t index) const {
    return read<int8_t, DataType::Int8>(values_[index], index, "i8");
}

std::optional<int16_t> Row::get_i16(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_i16_unchecked(index);
}

std::optional<int16_t> Row::get_i16_unchecked(std::size_t index) const {
    return read<int16_t, DataType::Int16>(values_[index], index, "i16");
}

std::optional<int32_t> Row::get_i32(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_i32_unchecked(index);
}

std::optional<int32_t> Row::get_i32_unchecked(std::size_t index) const {
    return read<int32_t, DataType::Int32>(values_[index], index, "i32");
}

std::optional<int64_t> Row::get_i64(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_i64_unchecked(index);
}

std::optional<int64_t> Row::get_i64_unchecked(std::size_t index) const {
    return read<int64_t, DataType::Int64>(values_[index], index, "i64");
}

std::optional<uint8_t> Row::get_u8(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_u8_unchecked(index);
}

std::optional<uint8_t> Row::get_u8_unchecked(std::size_t index) const {
    return read<uint8_t, DataType::Uint8>(values_[index], index, "u8");
}

std::optional<uint16_t> Row::get_u16(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_u16_unchecked(index);
}

std::optional<uint16_t> Row::get_u16_unchecked(std::size_t index) const {
    return read<uint16_t, DataType::Uint16>(values_[index], index, "u16");
}

std::optional<uint32_t> Row::get_u32(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_u32_unchecked(index);
}

std::optional<uint32_t> Row::get_u32_unchecked(std::size_t index) const {
    return read<uint32_t, DataType::Uint32>(values_[index], index, "u32");
}

std::optional<uint64_t> Row::get_u64(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_u64_unchecked(index);
}

std::optional<uint64_t> Row::get_u64_unchecked(std::size_t index) const {
    return read<uint64_t, DataType::Uint64>(values_[index], index, "u64");
}

std::optional<float> Row::get_f32(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_f32_unchecked(index);
}

std::optional<float> Row::get_f32_unchecked(std::size_t index) const {
    return read<float, DataType::Float32>(values_[index], index, "f32");
}

std::optional<double> Row::get_f64(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_f64_unchecked(index);
}

std::optional<double> Row::get_f64_unchecked(std::size_t index) const {
    return read<double, DataType::Float64>(values_[index], index, "f64");
}

std::optional<Bytes> Row::get_binary(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_binary_unchecked(index);
}

std::optional<Bytes> Row::get_binary_unchecked(std::size_t index) const {
    const Value& v = values_[index];
    if (v.is_null()) return std::nullopt;
    switch (v.type()) {
        case DataType::Binary:
            return v.as<Bytes>();
        case DataType::String:
        case DataType::Json:
            return text_bytes(v.as<std::string>());
        default:
            return type_mismatch<Bytes>(index, "binary", v);
    }
}

std::optional<Bytes> Row::take_binary(std::size_t index) {
    if (index >= values_.size()) return std::nullopt;
    return take_binary_unchecked(index);
}

std::optional<Bytes> Row::take_binary_unchecked(std::size_t index) {
    Value& v = values_[index];
    if (v.is_null()) return std::nullopt;
    switch (v.type()) {
        case DataType::Binary: {
            Bytes out = std::move(v.as<Bytes>());
            v = Value::null();
            return out;
        }
        case DataType::String:
        case DataType::Json: {
            Bytes out = text_bytes(v.as<std::string>());
            v = Value::null();
            return out;
        }
        default:
            return type_mismatch<Bytes>(index, "binary", v);
    }
}

std::optional<std::string> Row::get_string(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_string_unchecked(index);
}

std::optional<std::string> Row::get_string_unchecked(std::size_t index) const {
    return read<std::string, DataType::String>(values_[index], index, "string");
}

std::optional<std::string> Row::take_string(std::size_t index) {
    if (index >= values_.size()) return std::nullopt;
    return take_string_unchecked(index);
}

std::optional<std::string> Row::take_string_unchecked(std::size_t index) {
    return take<std::string, DataType::String>(values_[index], index, "string");
}

std::optional<std::string> Row::get_json(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_json_unchecked(index);
}

std::optional<std::string> Row::get_json_unchecked(std::size_t index) const {
    return read<std::string, DataType::Json>(values_[index], index, "json");
}

std::optional<std::string> Row::take_json(std::size_t index) {
    if (index >= values_.size()) return std::nullopt;
    return take_json_unchecked(index);
}

std::optional<std::string> Row::take_json_unchecked(std::size_t index) {
    return take<std::string, DataType::Json>(values_[index], index, "json");
}

std::optional<int32_t> Row::get_date(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_date_unchecked(index);
}

std::optional<int32_t> Row::get_date_unchecked(std::size_t index) const {
    return read<int32_t, DataType::Date>(values_[index], index, "date");
}

std::optional<int64_t> Row::get_datetime(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_datetime_unchecked(index);
}

std::optional<int64_t> Row::get_datetime_unchecked(std::size_t index) const {
    return read<int64_t, DataType::Datetime>(values_[index], index, "datetime");
}

std::optional<int64_t> Row::get_timestamp(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_timestamp_unchecked(index);
}

std::optional<int64_t> Row::get_timestamp_unchecked(std::size_t index) const {
    return read<int64_t,
                DataType::TimestampSecond,
                DataType::TimestampMillisecond,
                DataType::TimestampMicrosecond,
                DataType::TimestampNanosecond>(values_[index], index, "timestamp");
}

std::optional<int32_t> Row::get_time32(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_time32_unchecked(index);
}

std::optional<int32_t> Row::get_time32_unchecked(std::size_t index) const {
    return read<int32_t, DataType::TimeSecond, DataType::TimeMillisecond>(
        values_[index], index, "time32");
}

std::optional<int64_t> Row::get_time64(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_time64_unchecked(index);
}

std::optional<int64_t> Row::get_time64_unchecked(std::size_t index) const {
    return read<int64_t, DataType::TimeMicrosecond, DataType::TimeNanosecond>(
        values_[index], index, "time64");
}

std::optional<Int128> Row::get_decimal128(std::size_t index) const {
    if (index >= values_.size()) return std::nullopt;
    return get_decimal128_unchecked(index);
}

std::optional<Int128> Row::get_decimal128_unchecked(std::size_t index) const {
    return read<Int128, DataType::Decimal128>(values_[index], index, "decimal128");
}

}  // namespace tsingest
