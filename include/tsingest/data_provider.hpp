// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/error.hpp"
#include "tsingest/row.hpp"
#include "tsingest/schema.hpp"
#include "tsingest/wire.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tsingest {

// Lazy, single-pass sequence of structured rows. After the provider's
// row_count() rows every further next() returns std::nullopt.
class RowCursor {
public:
    virtual ~RowCursor() = default;
    virtual std::optional<Row> next() = 0;
};

// Lazy, single-pass sequence of wire rows.
class WireRowCursor {
public:
    virtual ~WireRowCursor() = default;
    virtual std::optional<WireRow> next() = 0;
};

// Base of every row source.
//
// init() runs once before the first pull and is where providers build their
// generator state; close() runs once after the last. Cursors are not safe for
// concurrent use.
class IDataProvider {
public:
    virtual ~IDataProvider() = default;

    virtual std::string name() const = 0;
    virtual Result<void> init() { return {}; }
    virtual std::size_t row_count() const = 0;
    virtual Result<void> close() { return {}; }
};

// Source of structured rows for the bulk writer path.
class ITableDataProvider : public virtual IDataProvider {
public:
    virtual TableSchema table_schema() const = 0;

    // Cursor over the provider's own position. A second call continues
    // where the previous cursor stopped.
    virtual std::unique_ptr<RowCursor> rows() = 0;
};

// Source of wire rows for the row insert path.
class IApiDataProvider : public virtual IDataProvider {
public:
    virtual std::string table_name() const = 0;
    virtual std::vector<WireColumnSchema> api_schema() const = 0;

    // Independent cursor starting at row 0. When generator state is shared
    // with rows(), the cursor saves and restores that state around each pull
    // so the two sequences can be driven in alternation.
    virtual std::unique_ptr<WireRowCursor> api_rows() = 0;
};

// Closes a provider whose run already failed. A close error is logged, the
// run's own error is the one reported.
void close_after_failure(IDataProvider& provider);

}  // namespace tsingest
