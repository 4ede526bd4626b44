// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/byte_buffer.hpp"
#include "tsingest/row.hpp"
#include "tsingest/row_buffer.hpp"
#include "tsingest/schema.hpp"

namespace tsingest {

// Binary batch layout, all integers big-endian:
//
//   header:  "TSBATCH\n" | int32 column count | per column: int16 DataType,
//            int16 SemanticType, int32 name length, name bytes
//   rows:    int16 field count | per field: int32 length (-1 for Null), payload
//   trailer: int16 -1
//
// Decimal128 payloads are 16 bytes (high half first). Floats are written as
// their IEEE-754 bit pattern.
class BatchEncoder {
public:
    explicit BatchEncoder(const TableSchema& schema) : schema_(schema) {}

    void write_header(ByteBuffer& buf) const;
    void encode_row(const Row& row, ByteBuffer& buf) const;
    void write_trailer(ByteBuffer& buf) const;

    // Header, every row of `batch`, trailer.
    void encode(const RowBuffer& batch, ByteBuffer& buf) const;

private:
    const TableSchema& schema_;
};

}  // namespace tsingest
