// SPDX-License-Identifier: MIT

// Bulk writer benchmark over the synthetic log table.
//
// Configuration comes from the environment, see tsingest::IngestConfig.

#include "bench/log_table_data_provider.hpp"
#include "tsingest/bulk_ingester.hpp"
#include "tsingest/config.hpp"
#include "tsingest/logging.hpp"
#include <asio.hpp>
#include <optional>

int main() {
    auto config = tsingest::IngestConfig::from_env();
    if (!tsingest::set_log_level(config.log_level)) {
        tsingest::log()->warn("unknown LOG_LEVEL '{}', using info", config.log_level);
    }
    tsingest::log()->info(
        "bulk benchmark: endpoint={} dbname={} rows={} batch={} parallelism={} compression={}",
        config.endpoint, config.dbname, config.table_row_count, config.batch_size,
        config.parallelism, tsingest::compression_name(config.compression));

    bench::LogTableDataProvider provider(bench::LogTableOptions{
        .table_name = "benchmark_logs",
        .row_count = config.table_row_count,
    });

    asio::io_context ctx;
    tsingest::BulkIngester ingester(tsingest::default_client_factory(ctx), config);

    std::optional<tsingest::IngestReport> report;
    asio::co_spawn(ctx, ingester.run(provider),
        [&report](std::exception_ptr ep, tsingest::IngestReport r) {
            if (ep) std::rethrow_exception(ep);
            report = std::move(r);
        });
    ctx.run();

    if (!report || !report->succeeded()) {
        tsingest::log()->error("bulk benchmark failed");
        return 1;
    }
    return 0;
}
