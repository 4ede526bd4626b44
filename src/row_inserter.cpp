// SPDX-License-Identifier: MIT

#include "tsingest/row_inserter.hpp"
#include "tsingest/logging.hpp"
#include <fmt/format.h>

namespace tsingest {

namespace {

using Clock = std::chrono::steady_clock;

}  // namespace

RowInserter::RowInserter(ClientFactory factory, IngestConfig config)
    : factory_(std::move(factory))
    , config_(std::move(config)) {}

IngestReport& RowInserter::fail(IngestReport& report, Error error) {
    log()->error("{}: {}", report.provider, to_string(error));
    report.error = std::move(error);
    report.state = IngestState::Errored;
    tracker_.transition(IngestState::Errored);
    return report;
}

asio::awaitable<IngestReport> RowInserter::run(IApiDataProvider& provider) {
    auto start = Clock::now();
    IngestReport report;
    report.provider = provider.name();
    report.table = provider.table_name();

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

    auto schema = provider.api_schema();
    auto cursor = provider.api_rows();
    log()->info("{}: inserting {} rows into '{}' (batch {})",
                report.provider, report.target_rows, report.table, config_.batch_size);

    bool exhausted = false;
    while (true) {
        tracker_.transition(IngestState::Filling);
        if (config_.batch_size == 0) break;

        InsertRequest request{
            .table_name = report.table,
            .schema = schema,
            .rows = {},
        };
        request.rows.reserve(config_.batch_size);
        while (request.rows.size() < config_.batch_size) {
            auto row = cursor->next();
            if (!row) {
                exhausted = true;
                break;
            }
            request.rows.push_back(std::move(*row));
        }
        if (request.rows.empty()) break;

        tracker_.transition(IngestState::Submitting);
        auto rows = request.rows.size();
        auto sent = Clock::now();
        auto affected = co_await (*client)->insert(std::move(request));
        auto latency = Clock::now() - sent;
        if (!affected) {
            close_after_failure(provider);
            co_return fail(report, std::move(affected.error()));
        }
        report.batch_count++;
        report.rows_written += rows;
        report.total_batch_latency += latency;
        report.record(WriteResponse{report.batch_count, *affected});
        log()->debug("{}: insert {} took {}us ({} rows)", report.provider, report.batch_count,
                     std::chrono::duration_cast<std::chrono::microseconds>(latency).count(),
                     *affected);

        if (exhausted) break;
    }

    // Every insert is acknowledged synchronously; nothing is outstanding.
    tracker_.transition(IngestState::Draining);

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
