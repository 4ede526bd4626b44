// SPDX-License-Identifier: MIT

#include "tsingest/ingest_report.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace tsingest {

std::string summary(const IngestReport& report) {
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(report.elapsed);
    std::string out = fmt::format(
        "{} -> {}: {} {}/{} rows in {} batches, {} acks, {} affected, {}, {:.0f} rows/s",
        report.provider, report.table, ingest_state_name(report.state),
        report.rows_written, report.target_rows, report.batch_count,
        report.acknowledgements.size(), report.affected_rows, elapsed_ms,
        report.rows_per_second());
    if (report.total_batch_latency.count() > 0) {
        auto avg = std::chrono::duration_cast<std::chrono::microseconds>(
            report.average_batch_latency());
        out += fmt::format(", avg batch latency {}", avg);
    }
    if (report.error) {
        out += fmt::format(" ({})", to_string(*report.error));
    }
    return out;
}

}  // namespace tsingest
