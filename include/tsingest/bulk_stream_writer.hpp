// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/client.hpp"
#include <asio.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace tsingest {

// BulkStreamWriter - IBulkWriter over an IBatchTransport.
//
// Every submitted batch runs as its own coroutine on the writer's
// io_context, at most options.parallelism at a time. A write that is not
// acknowledged within options.timeout fails with Timeout (a zero timeout
// disables the deadline). Acknowledgements are recorded in completion order.
//
// Write coroutines share state with the writer through a shared_ptr, so the
// writer may be destroyed while writes are still running on the context.
// Destroying or closing the writer fails every outstanding write with
// WriterClosed; late transport completions are discarded.
//
// IMPORTANT: Thread safety
// Not thread-safe. All calls must be made from the io_context thread.
class BulkStreamWriter : public IBulkWriter {
public:
    BulkStreamWriter(asio::io_context& ctx,
                     SchemaPtr schema,
                     std::shared_ptr<IBatchTransport> transport,
                     BulkWriteOptions options);
    ~BulkStreamWriter() override;

    BulkStreamWriter(const BulkStreamWriter&) = delete;
    BulkStreamWriter& operator=(const BulkStreamWriter&) = delete;

    Result<RowBuffer> allocate_buffer(std::size_t row_capacity,
                                      std::size_t avg_value_size_hint) override;
    asio::awaitable<Result<uint64_t>> submit(RowBuffer batch) override;
    Result<std::vector<WriteResponse>> poll_completed() override;
    asio::awaitable<Result<std::vector<WriteResponse>>> drain_all() override;
    std::size_t in_flight() const override;

    // Fails outstanding writes and rejects further submissions.
    void close();
    bool is_closed() const;

    const BulkWriteOptions& options() const { return options_; }

private:
    struct WriteSlot {
        explicit WriteSlot(asio::io_context& ctx) : deadline(ctx) {}
        bool finished = false;
        asio::steady_timer deadline;
    };

    struct State {
        asio::io_context& ctx;
        std::shared_ptr<IBatchTransport> transport;
        std::map<uint64_t, std::shared_ptr<WriteSlot>> pending;
        std::vector<WriteResponse> completed;
        std::optional<Error> error;
        bool closed = false;
        asio::steady_timer* waiter = nullptr;  // wakes submit()/drain_all()

        void complete(uint64_t batch_id, Result<uint64_t> result);
        void wake();
    };

    static asio::awaitable<void> run_write(std::shared_ptr<State> state,
                                           std::shared_ptr<WriteSlot> slot,
                                           uint64_t batch_id,
                                           RowBuffer batch);
    static asio::awaitable<void> watch_deadline(std::shared_ptr<State> state,
                                                std::shared_ptr<WriteSlot> slot,
                                                uint64_t batch_id);

    // Suspends until `ready` holds or a write failed.
    template <typename Pred>
    asio::awaitable<void> wait_until(Pred ready);

    asio::io_context& ctx_;
    SchemaPtr schema_;
    BulkWriteOptions options_;
    std::shared_ptr<State> state_;
    uint64_t next_batch_id_ = 1;
};

}  // namespace tsingest
