// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/error.hpp"
#include "tsingest/row.hpp"
#include "tsingest/schema.hpp"
#include <cstddef>
#include <vector>

namespace tsingest {

// RowBuffer - rows accumulated for one bulk write.
//
// Bound to the schema of the writer that allocated it. Capacity is a hint:
// adding past it reallocates, it never fails. Rows are owned by the buffer
// once added.
class RowBuffer {
public:
    explicit RowBuffer(SchemaPtr schema) : schema_(std::move(schema)) {}

    // Reserve room for `row_capacity` rows. `avg_value_size_hint` feeds
    // capacity_bytes() only.
    void allocate(std::size_t row_capacity, std::size_t avg_value_size_hint);

    // Fails with InvalidRow when the row length differs from the column count.
    Result<void> add_row(Row&& row);

    std::size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }
    std::size_t row_capacity() const { return rows_.capacity(); }
    std::size_t capacity_bytes() const { return capacity_bytes_; }

    // Running sum of Value::estimated_size() over added rows.
    std::size_t estimated_bytes() const { return estimated_bytes_; }

    const std::vector<Row>& rows() const { return rows_; }
    const TableSchema& schema() const { return *schema_; }
    const SchemaPtr& schema_ptr() const { return schema_; }

    // Moves the rows out and leaves the buffer empty.
    std::vector<Row> take_rows();

private:
    SchemaPtr schema_;
    std::vector<Row> rows_;
    std::size_t capacity_bytes_ = 0;
    std::size_t estimated_bytes_ = 0;
};

}  // namespace tsingest
