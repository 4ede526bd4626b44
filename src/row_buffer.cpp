// SPDX-License-Identifier: MIT

#include "tsingest/row_buffer.hpp"
#include <fmt/format.h>

namespace tsingest {

void RowBuffer::allocate(std::size_t row_capacity, std::size_t avg_value_size_hint) {
    rows_.reserve(row_capacity);
    capacity_bytes_ = row_capacity * schema_->column_count() * avg_value_size_hint;
}

Result<void> RowBuffer::add_row(Row&& row) {
    if (row.size() != schema_->column_count()) {
        return make_error(ErrorCode::InvalidRow,
            fmt::format("row {} has {} values, table '{}' has {} columns",
                        rows_.size(), row.size(), schema_->name(),
                        schema_->column_count()));
    }
    for (const auto& v : row.values()) {
        estimated_bytes_ += v.estimated_size();
    }
    rows_.push_back(std::move(row));
    return {};
}

std::vector<Row> RowBuffer::take_rows() {
    std::vector<Row> out = std::move(rows_);
    rows_.clear();
    estimated_bytes_ = 0;
    return out;
}

}  // namespace tsingest
