// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/error.hpp"
#include "tsingest/schema.hpp"
#include <string>
#include <vector>

namespace tsingest {

struct SchemaIssue {
    std::string column;   // "(table)" for table-level issues
    std::string problem;
};

enum class SchemaCheck {
    Warn,    // Log each issue, continue
    Strict,  // Fail if any issue
    Off,     // Skip validation
};

// Structural checks the builder leaves out: duplicate column names, exactly
// one non-nullable timestamp column, decimal extensions in range
// (1 <= precision <= 38, scale <= precision).
std::vector<SchemaIssue> validate_schema(const TableSchema& schema);

// Run validate_schema() under `mode`. Warn logs every issue and succeeds;
// Strict fails with InvalidSchema naming the first issue.
Result<void> check_schema(const TableSchema& schema, SchemaCheck mode);

}  // namespace tsingest
