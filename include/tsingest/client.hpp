// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/error.hpp"
#include "tsingest/row_buffer.hpp"
#include "tsingest/schema.hpp"
#include "tsingest/wire.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tsingest {

enum class CompressionType {
    None,
    Lz4,
    Zstd,
};

constexpr std::string_view compression_name(CompressionType c) {
    switch (c) {
        case CompressionType::None: return "none";
        case CompressionType::Lz4: return "lz4";
        case CompressionType::Zstd: return "zstd";
    }
    return "unknown";
}

struct BulkWriteOptions {
    CompressionType compression = CompressionType::Lz4;
    std::size_t parallelism = 8;                // >= 1 writes in flight
    std::chrono::milliseconds timeout{60000};   // per write

    BulkWriteOptions& with_compression(CompressionType c) {
        compression = c;
        return *this;
    }
    BulkWriteOptions& with_parallelism(std::size_t p) {
        parallelism = p == 0 ? 1 : p;
        return *this;
    }
    BulkWriteOptions& with_timeout(std::chrono::milliseconds t) {
        timeout = t;
        return *this;
    }
};

// Acknowledgement of one bulk write.
struct WriteResponse {
    uint64_t batch_id = 0;
    uint64_t affected_rows = 0;
};

// Streaming bulk writer bound to one table.
//
// Batches are submitted in order; their acknowledgements arrive in any order.
// The first failed write poisons the writer: the next submit, poll_completed
// or drain_all reports it.
class IBulkWriter {
public:
    virtual ~IBulkWriter() = default;

    virtual Result<RowBuffer> allocate_buffer(std::size_t row_capacity,
                                              std::size_t avg_value_size_hint) = 0;

    // Suspends only while every parallelism slot is taken. Completes once
    // the write is in flight, not when it is acknowledged.
    virtual asio::awaitable<Result<uint64_t>> submit(RowBuffer batch) = 0;

    // Acknowledgements completed since the previous call. Never suspends.
    virtual Result<std::vector<WriteResponse>> poll_completed() = 0;

    // Waits until no write is in flight and returns the remaining
    // acknowledgements.
    virtual asio::awaitable<Result<std::vector<WriteResponse>>> drain_all() = 0;

    virtual std::size_t in_flight() const = 0;
};

// One remote write of one batch. Used by BulkStreamWriter.
class IBatchTransport {
public:
    virtual ~IBatchTransport() = default;

    // Returns the number of rows the store accepted.
    virtual asio::awaitable<Result<uint64_t>> write(uint64_t batch_id,
                                                    const RowBuffer& batch) = 0;
};

// Connection to the remote store.
class IIngestClient {
public:
    virtual ~IIngestClient() = default;

    virtual Result<std::unique_ptr<IBulkWriter>> create_bulk_writer(
        SchemaPtr schema, BulkWriteOptions options) = 0;

    // One synchronous row-insert request. Returns the affected row count.
    virtual asio::awaitable<Result<uint64_t>> insert(InsertRequest request) = 0;
};

// Opens a client for (endpoint, dbname).
using ClientFactory = std::function<Result<std::unique_ptr<IIngestClient>>(
    std::string_view endpoint, std::string_view dbname)>;

// Connects to the endpoints this library can reach: "loopback" and
// "loopback:<latency_ms>". Anything else fails with ConnectionFailed.
Result<std::unique_ptr<IIngestClient>> create_client(asio::io_context& ctx,
                                                     std::string_view endpoint,
                                                     std::string_view dbname);

// create_client() bound to `ctx`.
ClientFactory default_client_factory(asio::io_context& ctx);

}  // namespace tsingest
