// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/batch_encoder.hpp"
#include "tsingest/client.hpp"
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tsingest {

// Bytes and rows accepted by a loopback endpoint.
struct LoopbackStats {
    uint64_t batches = 0;
    uint64_t rows = 0;
    uint64_t encoded_bytes = 0;  // before compression
    uint64_t sent_bytes = 0;     // after compression
    uint64_t insert_requests = 0;
};

// In-process IBatchTransport.
//
// Encodes each batch with BatchEncoder, compresses it with zstd when the
// writer asked for Zstd, waits `latency` and acknowledges every row. Lz4
// batches are sent uncompressed.
class LoopbackTransport : public IBatchTransport {
public:
    LoopbackTransport(asio::io_context& ctx,
                      CompressionType compression,
                      std::chrono::milliseconds latency,
                      std::shared_ptr<LoopbackStats> stats);

    asio::awaitable<Result<uint64_t>> write(uint64_t batch_id,
                                            const RowBuffer& batch) override;

private:
    asio::io_context& ctx_;
    CompressionType compression_;
    std::chrono::milliseconds latency_;
    std::shared_ptr<LoopbackStats> stats_;
};

// In-process IIngestClient for the "loopback" endpoint.
class LoopbackClient : public IIngestClient {
public:
    LoopbackClient(asio::io_context& ctx, std::string dbname,
                   std::chrono::milliseconds latency = std::chrono::milliseconds{0});

    Result<std::unique_ptr<IBulkWriter>> create_bulk_writer(
        SchemaPtr schema, BulkWriteOptions options) override;

    asio::awaitable<Result<uint64_t>> insert(InsertRequest request) override;

    const std::string& dbname() const { return dbname_; }
    std::chrono::milliseconds latency() const { return latency_; }
    const LoopbackStats& stats() const { return *stats_; }

private:
    asio::io_context& ctx_;
    std::string dbname_;
    std::chrono::milliseconds latency_;
    std::shared_ptr<LoopbackStats> stats_;
};

// Parses "loopback" or "loopback:<latency_ms>". Returns std::nullopt for any
// other endpoint.
std::optional<std::chrono::milliseconds> parse_loopback_endpoint(std::string_view endpoint);

// zstd-compress `data` at the default level.
Result<std::vector<std::byte>> zstd_compress(std::span<const std::byte> data);

}  // namespace tsingest
