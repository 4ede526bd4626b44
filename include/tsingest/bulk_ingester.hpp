// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/client.hpp"
#include "tsingest/config.hpp"
#include "tsingest/data_provider.hpp"
#include "tsingest/ingest_report.hpp"
#include <asio.hpp>

namespace tsingest {

// BulkIngester - streams a table provider through a bulk writer.
//
// One run:
//   1. check the provider's schema (config.schema_check)
//   2. provider.init()
//   3. connect via the client factory and create a bulk writer
//   4. Filling: pull up to batch_size rows into a writer buffer
//      Submitting: submit it; every reconcile_interval batches collect
//      finished acknowledgements without blocking
//      repeat until the source is exhausted or a batch comes back empty
//   5. Draining: wait for every outstanding acknowledgement
//   6. provider.close()
//
// Any failure ends the run in Errored with the error in the report; no
// further batch is filled after a failed submission. There is no retry.
//
// IMPORTANT: Thread safety
// run() is a single coroutine on the io_context the client factory is
// bound to. Not thread-safe.
class BulkIngester {
public:
    BulkIngester(ClientFactory factory, IngestConfig config);

    BulkIngester(const BulkIngester&) = delete;
    BulkIngester& operator=(const BulkIngester&) = delete;

    asio::awaitable<IngestReport> run(ITableDataProvider& provider);

    IngestState state() const { return tracker_.state(); }
    void on_state_change(IngestStateTracker::Callback cb) {
        tracker_.on_state_change(std::move(cb));
    }

    const IngestConfig& config() const { return config_; }

private:
    IngestReport& fail(IngestReport& report, Error error);

    ClientFactory factory_;
    IngestConfig config_;
    IngestStateTracker tracker_;
};

}  // namespace tsingest
