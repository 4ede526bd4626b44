// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <string_view>

namespace tsingest {

/// @name Column data types
/// Every primitive the remote store accepts.  Values carry one of these as
/// their case; columns declare one as their type.
/// @{
enum class DataType : uint8_t {
    Boolean,
    Int8,
    Int16,
    Int32,
    Int64,
    Uint8,
    Uint16,
    Uint32,
    Uint64,
    Float32,
    Float64,
    Binary,
    String,
    Date,                  ///< Days since Unix epoch (int32).
    Datetime,              ///< Milliseconds since Unix epoch (int64).
    TimestampSecond,
    TimestampMillisecond,
    TimestampMicrosecond,
    TimestampNanosecond,
    TimeSecond,            ///< Time of day, int32.
    TimeMillisecond,       ///< Time of day, int32.
    TimeMicrosecond,       ///< Time of day, int64.
    TimeNanosecond,        ///< Time of day, int64.
    Decimal128,            ///< Precision and scale live on the column.
    Json,                  ///< JSON document stored as text.
};
/// @}

/// Role of a column in a time-series table.
enum class SemanticType : uint8_t {
    Tag,        ///< Grouping/identity of a series.
    Timestamp,  ///< The time index.
    Field,      ///< Measurement value.
};

constexpr std::string_view data_type_name(DataType type) {
    switch (type) {
        case DataType::Boolean: return "Boolean";
        case DataType::Int8: return "Int8";
        case DataType::Int16: return "Int16";
        case DataType::Int32: return "Int32";
        case DataType::Int64: return "Int64";
        case DataType::Uint8: return "Uint8";
        case DataType::Uint16: return "Uint16";
        case DataType::Uint32: return "Uint32";
        case DataType::Uint64: return "Uint64";
        case DataType::Float32: return "Float32";
        case DataType::Float64: return "Float64";
        case DataType::Binary: return "Binary";
        case DataType::String: return "String";
        case DataType::Date: return "Date";
        case DataType::Datetime: return "Datetime";
        case DataType::TimestampSecond: return "TimestampSecond";
        case DataType::TimestampMillisecond: return "TimestampMillisecond";
        case DataType::TimestampMicrosecond: return "TimestampMicrosecond";
        case DataType::TimestampNanosecond: return "TimestampNanosecond";
        case DataType::TimeSecond: return "TimeSecond";
        case DataType::TimeMillisecond: return "TimeMillisecond";
        case DataType::TimeMicrosecond: return "TimeMicrosecond";
        case DataType::TimeNanosecond: return "TimeNanosecond";
        case DataType::Decimal128: return "Decimal128";
        case DataType::Json: return "Json";
    }
    return "Unknown";
}

constexpr std::string_view semantic_type_name(SemanticType type) {
    switch (type) {
        case SemanticType::Tag: return "Tag";
        case SemanticType::Timestamp: return "Timestamp";
        case SemanticType::Field: return "Field";
    }
    return "Unknown";
}

constexpr bool is_timestamp(DataType type) {
    return type == DataType::TimestampSecond ||
           type == DataType::TimestampMillisecond ||
           type == DataType::TimestampMicrosecond ||
           type == DataType::TimestampNanosecond;
}

}  // namespace tsingest
