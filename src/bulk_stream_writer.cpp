// SPDX-License-Identifier: MIT

#include "tsingest/bulk_stream_writer.hpp"
#include "tsingest/logging.hpp"
#include <fmt/format.h>

namespace tsingest {

namespace {

// Fallback wakeup for wait_until(); normal wakeup is State::wake().
constexpr auto kWaitPollInterval = std::chrono::seconds(1);

}  // namespace

void BulkStreamWriter::State::complete(uint64_t batch_id, Result<uint64_t> result) {
    pending.erase(batch_id);
    if (result) {
        log()->debug("batch {} acknowledged, {} rows", batch_id, *result);
        completed.push_back(WriteResponse{batch_id, *result});
    } else {
        log()->debug("batch {} failed: {}", batch_id, to_string(result.error()));
        if (!error) error = std::move(result.error());
    }
    wake();
}

void BulkStreamWriter::State::wake() {
    if (waiter) {
        waiter->cancel();
    }
}

BulkStreamWriter::BulkStreamWriter(asio::io_context& ctx,
                                   SchemaPtr schema,
                                   std::shared_ptr<IBatchTransport> transport,
                                   BulkWriteOptions options)
    : ctx_(ctx)
    , schema_(std::move(schema))
    , options_(options)
    , state_(std::make_shared<State>(State{.ctx = ctx, .transport = std::move(transport)})) {
    if (options_.parallelism == 0) options_.parallelism = 1;
}

BulkStreamWriter::~BulkStreamWriter() {
    close();
}

Result<RowBuffer> BulkStreamWriter::allocate_buffer(std::size_t row_capacity,
                                                    std::size_t avg_value_size_hint) {
    if (state_->closed) {
        return make_error(ErrorCode::WriterClosed, "bulk writer is closed");
    }
    RowBuffer buffer(schema_);
    buffer.allocate(row_capacity, avg_value_size_hint);
    return buffer;
}

template <typename Pred>
asio::awaitable<void> BulkStreamWriter::wait_until(Pred ready) {
    while (!ready() && !state_->error) {
        asio::steady_timer timer(ctx_, kWaitPollInterval);
        state_->waiter = &timer;
        asio::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        state_->waiter = nullptr;
        // ec == operation_aborted means a write completed; loop re-checks
    }
}

asio::awaitable<Result<uint64_t>> BulkStreamWriter::submit(RowBuffer batch) {
    if (state_->closed) {
        co_return make_error(ErrorCode::WriterClosed, "bulk writer is closed");
    }
    if (batch.schema_ptr() != schema_) {
        co_return make_error(ErrorCode::SubmitFailed, fmt::format(
            "buffer for table '{}' submitted to writer for table '{}'",
            batch.schema().name(), schema_->name()));
    }

    co_await wait_until([this] { return state_->pending.size() < options_.parallelism; });

    if (state_->error) co_return std::unexpected(*state_->error);
    if (state_->closed) {
        co_return make_error(ErrorCode::WriterClosed, "bulk writer closed while waiting");
    }

    uint64_t batch_id = next_batch_id_++;
    auto slot = std::make_shared<WriteSlot>(ctx_);
    state_->pending.emplace(batch_id, slot);
    log()->debug("batch {} submitted, {} rows, {} in flight",
                 batch_id, batch.size(), state_->pending.size());

    if (options_.timeout.count() > 0) {
        slot->deadline.expires_after(options_.timeout);
        asio::co_spawn(ctx_, watch_deadline(state_, slot, batch_id), asio::detached);
    }
    asio::co_spawn(ctx_, run_write(state_, slot, batch_id, std::move(batch)), asio::detached);
    co_return batch_id;
}

Result<std::vector<WriteResponse>> BulkStreamWriter::poll_completed() {
    if (state_->error) return std::unexpected(*state_->error);
    std::vector<WriteResponse> out;
    out.swap(state_->completed);
    return out;
}

asio::awaitable<Result<std::vector<WriteResponse>>> BulkStreamWriter::drain_all() {
    // A failure does not end the wait: every write must settle first.
    while (!state_->pending.empty()) {
        asio::steady_timer timer(ctx_, kWaitPollInterval);
        state_->waiter = &timer;
        asio::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        state_->waiter = nullptr;
    }
    if (state_->error) co_return std::unexpected(*state_->error);
    std::vector<WriteResponse> out;
    out.swap(state_->completed);
    co_return out;
}

std::size_t BulkStreamWriter::in_flight() const {
    return state_->pending.size();
}

void BulkStreamWriter::close() {
    if (state_->closed) return;
    state_->closed = true;
    auto pending = std::move(state_->pending);
    state_->pending.clear();
    for (auto& [batch_id, slot] : pending) {
        slot->finished = true;
        slot->deadline.cancel();
        if (!state_->error) {
            state_->error = Error{ErrorCode::WriterClosed,
                fmt::format("batch {} still in flight when writer closed", batch_id)};
        }
    }
    if (!pending.empty()) {
        log()->warn("bulk writer closed with {} writes in flight", pending.size());
    }
    state_->wake();
}

bool BulkStreamWriter::is_closed() const {
    return state_->closed;
}

asio::awaitable<void> BulkStreamWriter::run_write(std::shared_ptr<State> state,
                                                  std::shared_ptr<WriteSlot> slot,
                                                  uint64_t batch_id,
                                                  RowBuffer batch) {
    Result<uint64_t> result = make_error(ErrorCode::WriteFailed, "write did not complete");
    try {
        result = co_await state->transport->write(batch_id, batch);
    } catch (const std::exception& e) {
        result = make_error(ErrorCode::WriteFailed,
                            fmt::format("batch {}: {}", batch_id, e.what()));
    }
    if (slot->finished) co_return;  // timed out or closed
    slot->finished = true;
    slot->deadline.cancel();
    state->complete(batch_id, std::move(result));
}

asio::awaitable<void> BulkStreamWriter::watch_deadline(std::shared_ptr<State> state,
                                                       std::shared_ptr<WriteSlot> slot,
                                                       uint64_t batch_id) {
    asio::error_code ec;
    co_await slot->deadline.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    if (ec || slot->finished) co_return;
    slot->finished = true;
    state->complete(batch_id, make_error(ErrorCode::Timeout,
        fmt::format("batch {} not acknowledged in time", batch_id)));
}

}  // namespace tsingest
