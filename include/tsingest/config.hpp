// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/client.hpp"
#include "tsingest/schema_validator.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tsingest {

// Settings of one ingestion run.
struct IngestConfig {
    std::string endpoint = "loopback";
    std::string dbname = "public";
    std::size_t table_row_count = 2'000'000;
    std::size_t batch_size = 100'000;
    std::size_t parallelism = 8;
    CompressionType compression = CompressionType::Lz4;
    std::size_t reconcile_interval = 10;     // batches between poll_completed()
    std::size_t avg_value_size_hint = 32;    // bytes, for buffer sizing
    std::chrono::milliseconds write_timeout{60'000};
    std::string log_level = "info";
    SchemaCheck schema_check = SchemaCheck::Warn;

    // Returns the value of a key, or std::nullopt when unset.
    using Getter = std::function<std::optional<std::string>(std::string_view key)>;

    // Reads INGEST_ENDPOINT, INGEST_DBNAME, TABLE_ROW_COUNT, BATCH_SIZE,
    // PARALLELISM, COMPRESSION, RECONCILE_INTERVAL and LOG_LEVEL. Missing or
    // unparsable values keep the default; a zero parallelism becomes 1.
    static IngestConfig from_env(const Getter& get);
    static IngestConfig from_env();

    BulkWriteOptions bulk_options() const;
};

// none|false|0, lz4 or zstd, case-insensitive. Anything else logs a warning
// and yields Lz4.
CompressionType parse_compression(std::string_view name);

}  // namespace tsingest
