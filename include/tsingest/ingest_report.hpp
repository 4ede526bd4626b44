// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/client.hpp"
#include "tsingest/error.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsingest {

enum class IngestState {
    Idle,
    Filling,
    Submitting,
    Draining,
    Finished,  // terminal
    Errored,   // terminal
};

constexpr std::string_view ingest_state_name(IngestState s) {
    switch (s) {
        case IngestState::Idle: return "idle";
        case IngestState::Filling: return "filling";
        case IngestState::Submitting: return "submitting";
        case IngestState::Draining: return "draining";
        case IngestState::Finished: return "finished";
        case IngestState::Errored: return "errored";
    }
    return "unknown";
}

// Current state of a run plus an optional observer, shared by BulkIngester
// and RowInserter.
class IngestStateTracker {
public:
    using Callback = std::function<void(IngestState)>;

    IngestState state() const { return state_; }
    void on_state_change(Callback cb) { callback_ = std::move(cb); }

    void transition(IngestState next) {
        state_ = next;
        if (callback_) callback_(next);
    }

private:
    IngestState state_ = IngestState::Idle;
    Callback callback_;
};

// Outcome and throughput of one run. Filled in as the run progresses; it
// never drives control flow.
struct IngestReport {
    std::string provider;
    std::string table;
    std::size_t target_rows = 0;
    uint64_t rows_written = 0;     // rows handed to the store
    uint64_t batch_count = 0;
    std::vector<WriteResponse> acknowledgements;
    uint64_t affected_rows = 0;    // sum over acknowledgements
    std::chrono::nanoseconds elapsed{0};
    std::chrono::nanoseconds total_batch_latency{0};  // insert path only
    IngestState state = IngestState::Idle;
    std::optional<Error> error;

    bool succeeded() const { return state == IngestState::Finished && !error; }

    void record(WriteResponse ack) {
        affected_rows += ack.affected_rows;
        acknowledgements.push_back(ack);
    }

    double rows_per_second() const {
        auto secs = std::chrono::duration<double>(elapsed).count();
        return secs > 0 ? static_cast<double>(rows_written) / secs : 0.0;
    }

    std::chrono::nanoseconds average_batch_latency() const {
        if (batch_count == 0) return std::chrono::nanoseconds{0};
        return total_batch_latency / static_cast<int64_t>(batch_count);
    }
};

// One-line summary for logs.
std::string summary(const IngestReport& report);

}  // namespace tsingest
