// SPDX-License-Identifier: MIT

#include "tsingest/bulk_ingester.hpp"
#include "tsingest/logging.hpp"
#include "tsingest/schema_validator.hpp"
#include <fmt/format.h>

namespace tsingest {

namespace {

using Clock = std::chrono::steady_clock;

}  // namespace

BulkIngester::BulkIngester(ClientFactory factory, IngestConfig config)
    : factory_(std::move(factory))
    , config_(std::move(config)) {}

IngestReport& BulkIngester::fail(IngestReport& report, Error error) {
    log()->error("{}: {}", report.provider, to_string(error));
    report.error = std::move(error);
    report.state = IngestState::Errored;
    tracker_.transition(IngestState::Errored);
    return report;
}

asio::awaitable<IngestReport> BulkIngester::run(ITableDataProvider& provider) {
    auto start = Clock::now();
    IngestReport report;
    report.provider = provider.name();

    auto schema = std::make_shared<const TableSchema>(provider.table_schema());
    report.table = schema->name();

    if (auto checked = check_schema(*schema, config_.schema_check); !checked) {
        co_return fail(report, std::move(checked.error()));
    }

    if (auto init = provider.init(); !init) {
        co_return fail(report, Error{ErrorCode::ProviderInitFailed, fmt::format(
            "{} init failed: {}", provider.name(), init.error().message)});
    }
    report.target_rows = provider.row_count();

    auto client = factory_(config_.endpoint, config_.dbname);
    if (!client) {
        close_after_failure(provider);
        co_return fail(report, std::move(client.error()));
    }

    auto writer = (*client)->create_bulk_writer(schema, config_.bulk_options());
    if (!writer) {
        close_after_failure(provider);
        co_return fail(report, std::move(writer.error()));
    }

    log()->info("{}: streaming {} rows into '{}' (batch {}, parallelism {}, {})",
                report.provider, report.target_rows, report.table, config_.batch_size,
                config_.parallelism, compression_name(config_.compression));

    auto cursor = provider.rows();
    bool exhausted = false;
    while (true) {
        tracker_.transition(IngestState::Filling);
        if (config_.batch_size == 0) break;

        auto buffer = (*writer)->allocate_buffer(config_.batch_size,
                                                 config_.avg_value_size_hint);
        if (!buffer) {
            close_after_failure(provider);
            co_return fail(report, std::move(buffer.error()));
        }
        while (buffer->size() < config_.batch_size) {
            auto row = cursor->next();
            if (!row) {
                exhausted = true;
                break;
            }
            if (auto added = buffer->add_row(std::move(*row)); !added) {
                close_after_failure(provider);
                co_return fail(report, std::move(added.error()));
            }
        }
        if (buffer->empty()) break;

        tracker_.transition(IngestState::Submitting);
        auto rows = buffer->size();
        auto batch_id = co_await (*writer)->submit(std::move(*buffer));
        if (!batch_id) {
            close_after_failure(provider);
            co_return fail(report, std::move(batch_id.error()));
        }
        report.rows_written += rows;
        report.batch_count++;
        log()->debug("{}: batch {} submitted ({} rows, {} total)",
                     report.provider, *batch_id, rows, report.rows_written);

        if (config_.reconcile_interval > 0 &&
            report.batch_count % config_.reconcile_interval == 0) {
            auto acks = (*writer)->poll_completed();
            if (!acks) {
                close_after_failure(provider);
                co_return fail(report, std::move(acks.error()));
            }
            for (const auto& ack : *acks) report.record(ack);
        }

        if (exhausted) break;
    }

    tracker_.transition(IngestState::Draining);
    auto rest = co_await (*writer)->drain_all();
    if (!rest) {
        close_after_failure(provider);
        co_return fail(report, std::move(rest.error()));
    }
    for (const auto& ack : *rest) report.record(ack);

    if (auto closed = provider.close(); !closed) {
        co_return fail(report, Error{ErrorCode::ProviderCloseFailed, fmt::format(
            "{} close failed: {}", provider.name(), closed.error().message)});
    }

    report.elapsed = Clock::now() - start;
    report.state = IngestState::Finished;
    tracker_.transition(IngestState::Finished);
    log()->info("{}", summary(report));
    co_return report;
}

}  // namespace tsingest
