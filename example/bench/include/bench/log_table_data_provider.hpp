// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/data_provider.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bench {

struct LogTableOptions {
    std::string table_name = "benchmark_logs";
    std::size_t row_count = 0;
    std::size_t message_length = 1500;
    std::optional<uint64_t> seed;           // random when unset
    std::optional<int64_t> base_time_ms;    // now when unset
};

// LogTableDataProvider - synthetic 22-column log table.
//
// init() pre-generates value pools of min(10000, 2 * row_count) entries;
// rows are composed from the pools by index arithmetic, so generating a row
// costs a handful of string copies. Row i carries timestamp
// base_time + i + ((i * 7 + 13) % pool) % 2000 - 1000.
//
// rows() advances the provider's own position. api_rows() cursors keep an
// independent position.
class LogTableDataProvider : public tsingest::ITableDataProvider,
                             public tsingest::IApiDataProvider {
public:
    static constexpr std::size_t kColumnCount = 22;
    static constexpr std::size_t kMaxPoolSize = 10000;

    explicit LogTableDataProvider(LogTableOptions options);

    std::string name() const override { return "log_table"; }
    tsingest::Result<void> init() override;
    std::size_t row_count() const override { return options_.row_count; }
    tsingest::Result<void> close() override;

    tsingest::TableSchema table_schema() const override;
    std::unique_ptr<tsingest::RowCursor> rows() override;

    std::string table_name() const override { return options_.table_name; }
    std::vector<tsingest::WireColumnSchema> api_schema() const override;
    std::unique_ptr<tsingest::WireRowCursor> api_rows() override;

    // Rewinds rows() to the first row.
    void reset() { current_row_ = 0; }

    std::size_t pool_size() const { return host_ids_.size(); }
    std::size_t current_row() const { return current_row_; }
    int64_t base_time() const { return base_time_; }

private:
    class TableCursor;
    class ApiCursor;

    // String columns between ts and response_time_ms, in schema order.
    static constexpr std::size_t kStringFields = 18;

    struct LogRecord {
        int64_t ts;
        std::array<const std::string*, kStringFields> fields;
        int64_t response_time_ms;
    };

    std::optional<LogRecord> compose(std::size_t row) const;
    std::optional<tsingest::Row> generate_row();
    std::optional<tsingest::WireRow> generate_api_row();

    LogTableOptions options_;
    bool initialized_ = false;
    std::size_t current_row_ = 0;
    int64_t base_time_ = 0;

    std::vector<std::string> host_ids_;
    std::vector<std::string> host_names_;
    std::vector<std::string> service_ids_;
    std::vector<std::string> service_names_;
    std::vector<std::string> container_ids_;
    std::vector<std::string> container_names_;
    std::vector<std::string> pod_ids_;
    std::vector<std::string> pod_names_;
    std::vector<std::string> cluster_ids_;
    std::vector<std::string> cluster_names_;
    std::vector<std::string> trace_ids_;
    std::vector<std::string> span_ids_;
    std::vector<std::string> user_ids_;
    std::vector<std::string> session_ids_;
    std::vector<std::string> request_ids_;
    std::vector<std::string> log_uids_;
    std::vector<std::string> log_levels_;
    std::vector<std::string> log_messages_;
};

}  // namespace bench
