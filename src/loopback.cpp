// SPDX-License-Identifier: MIT

#include "tsingest/loopback.hpp"
#include "tsingest/bulk_stream_writer.hpp"
#include "tsingest/logging.hpp"
#include <zstd.h>
#include <fmt/format.h>
#include <charconv>

namespace tsingest {

namespace {

constexpr std::string_view kLoopbackScheme = "loopback";

asio::awaitable<void> simulate_latency(asio::io_context& ctx, std::chrono::milliseconds latency) {
    if (latency.count() <= 0) {
        co_await asio::post(ctx, asio::use_awaitable);
        co_return;
    }
    asio::steady_timer timer(ctx, latency);
    co_await timer.async_wait(asio::use_awaitable);
}

}  // namespace

Result<std::vector<std::byte>> zstd_compress(std::span<const std::byte> data) {
    std::vector<std::byte> out(ZSTD_compressBound(data.size()));
    size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(),
                             ZSTD_CLEVEL_DEFAULT);
    if (ZSTD_isError(n)) {
        return make_error(ErrorCode::WriteFailed,
            fmt::format("zstd compression failed: {}", ZSTD_getErrorName(n)));
    }
    out.resize(n);
    return out;
}

std::optional<std::chrono::milliseconds> parse_loopback_endpoint(std::string_view endpoint) {
    if (endpoint == kLoopbackScheme) return std::chrono::milliseconds{0};
    if (!endpoint.starts_with(kLoopbackScheme) ||
        endpoint.size() <= kLoopbackScheme.size() + 1 ||
        endpoint[kLoopbackScheme.size()] != ':') {
        return std::nullopt;
    }
    auto digits = endpoint.substr(kLoopbackScheme.size() + 1);
    int64_t ms = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), ms);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || ms < 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds{ms};
}

LoopbackTransport::LoopbackTransport(asio::io_context& ctx,
                                     CompressionType compression,
                                     std::chrono::milliseconds latency,
                                     std::shared_ptr<LoopbackStats> stats)
    : ctx_(ctx)
    , compression_(compression)
    , latency_(latency)
    , stats_(std::move(stats)) {}

asio::awaitable<Result<uint64_t>> LoopbackTransport::write(uint64_t batch_id,
                                                           const RowBuffer& batch) {
    ByteBuffer buf;
    BatchEncoder(batch.schema()).encode(batch, buf);

    uint64_t sent = buf.size();
    if (compression_ == CompressionType::Zstd) {
        auto compressed = zstd_compress(buf.view());
        if (!compressed) co_return std::unexpected(compressed.error());
        sent = compressed->size();
    }

    co_await simulate_latency(ctx_, latency_);

    stats_->batches++;
    stats_->rows += batch.size();
    stats_->encoded_bytes += buf.size();
    stats_->sent_bytes += sent;
    log()->trace("loopback batch {}: {} rows, {} bytes ({} on the wire)",
                 batch_id, batch.size(), buf.size(), sent);
    co_return batch.size();
}

LoopbackClient::LoopbackClient(asio::io_context& ctx, std::string dbname,
                               std::chrono::milliseconds latency)
    : ctx_(ctx)
    , dbname_(std::move(dbname))
    , latency_(latency)
    , stats_(std::make_shared<LoopbackStats>()) {}

Result<std::unique_ptr<IBulkWriter>> LoopbackClient::create_bulk_writer(
        SchemaPtr schema, BulkWriteOptions options) {
    if (!schema) {
        return make_error(ErrorCode::WriterSetupFailed, "bulk writer needs a table schema");
    }
    auto transport = std::make_shared<LoopbackTransport>(
        ctx_, options.compression, latency_, stats_);
    return std::make_unique<BulkStreamWriter>(ctx_, std::move(schema),
                                              std::move(transport), options);
}

asio::awaitable<Result<uint64_t>> LoopbackClient::insert(InsertRequest request) {
    for (std::size_t i = 0; i < request.rows.size(); ++i) {
        if (request.rows[i].values.size() != request.schema.size()) {
            co_return make_error(ErrorCode::InsertFailed, fmt::format(
                "insert into '{}': row {} has {} values, expected {}",
                request.table_name, i, request.rows[i].values.size(),
                request.schema.size()));
        }
    }

    co_await simulate_latency(ctx_, latency_);

    stats_->insert_requests++;
    stats_->rows += request.rows.size();
    co_return request.rows.size();
}

Result<std::unique_ptr<IIngestClient>> create_client(asio::io_context& ctx,
                                                     std::string_view endpoint,
                                                     std::string_view dbname) {
    auto latency = parse_loopback_endpoint(endpoint);
    if (!latency) {
        return make_error(ErrorCode::ConnectionFailed,
            fmt::format("no transport for endpoint '{}'", endpoint));
    }
    log()->debug("connected to {} (database '{}')", endpoint, dbname);
    return std::make_unique<LoopbackClient>(ctx, std::string{dbname}, *latency);
}

ClientFactory default_client_factory(asio::io_context& ctx) {
    return [&ctx](std::string_view endpoint, std::string_view dbname) {
        return create_client(ctx, endpoint, dbname);
    };
}

}  // namespace tsingest
