// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/client.hpp"
#include "tsingest/config.hpp"
#include "tsingest/data_provider.hpp"
#include "tsingest/ingest_report.hpp"
#include <asio.hpp>

namespace tsingest {

// RowInserter - sends wire rows as one insert request per batch.
//
// Each request is awaited before the next batch is filled, so at most one
// request is outstanding and the per-batch latency is measured. The first
// failed request ends the run in Errored.
class RowInserter {
public:
    RowInserter(ClientFactory factory, IngestConfig config);

    RowInserter(const RowInserter&) = delete;
    RowInserter& operator=(const RowInserter&) = delete;

    asio::awaitable<IngestReport> run(IApiDataProvider& provider);

    IngestState state() const { return tracker_.state(); }
    void on_state_change(IngestStateTracker::Callback cb) {
        tracker_.on_state_change(std::move(cb));
    }

private:
    IngestReport& fail(IngestReport& report, Error error);

    ClientFactory factory_;
    IngestConfig config_;
    IngestStateTracker tracker_;
};

}  // namespace tsingest
