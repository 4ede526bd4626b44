// SPDX-License-Identifier: MIT

#pragma once

#include "tsingest/client.hpp"
#include "tsingest/data_provider.hpp"
#include <gmock/gmock.h>
#include <asio.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tsingest::testing {

class MockIngestClient : public IIngestClient {
public:
    MOCK_METHOD(Result<std::unique_ptr<IBulkWriter>>, create_bulk_writer,
        (SchemaPtr, BulkWriteOptions), (override));
    MOCK_METHOD(asio::awaitable<Result<uint64_t>>, insert, (InsertRequest), (override));
};

// Calls seen by the fakes below. The engine owns and destroys the client and
// its writers, so tests read what happened from here.
struct FakeCalls {
    std::vector<std::size_t> submitted_sizes;
    std::size_t writers_created = 0;
    std::size_t poll_calls = 0;
    std::size_t drain_calls = 0;
    std::vector<std::size_t> insert_sizes;
};

// Bulk writer that acknowledges every batch immediately. fail_on_batch makes
// the n-th submit (1-based) fail.
class FakeBulkWriter : public IBulkWriter {
public:
    FakeBulkWriter(SchemaPtr schema, std::shared_ptr<FakeCalls> calls)
        : schema_(std::move(schema)), calls_(std::move(calls)) {}

    std::optional<std::size_t> fail_on_batch;
    bool fail_drain = false;

    Result<RowBuffer> allocate_buffer(std::size_t row_capacity,
                                      std::size_t avg_value_size_hint) override {
        RowBuffer buffer(schema_);
        buffer.allocate(row_capacity, avg_value_size_hint);
        return buffer;
    }

    asio::awaitable<Result<uint64_t>> submit(RowBuffer batch) override {
        uint64_t id = calls_->submitted_sizes.size() + 1;
        if (fail_on_batch && *fail_on_batch == id) {
            co_return make_error(ErrorCode::SubmitFailed, "injected submit failure");
        }
        calls_->submitted_sizes.push_back(batch.size());
        pending_.push_back(WriteResponse{id, batch.size()});
        co_return id;
    }

    Result<std::vector<WriteResponse>> poll_completed() override {
        ++calls_->poll_calls;
        std::vector<WriteResponse> out;
        out.swap(pending_);
        return out;
    }

    asio::awaitable<Result<std::vector<WriteResponse>>> drain_all() override {
        ++calls_->drain_calls;
        if (fail_drain) {
            co_return make_error(ErrorCode::WriteFailed, "injected write failure");
        }
        std::vector<WriteResponse> out;
        out.swap(pending_);
        co_return out;
    }

    std::size_t in_flight() const override { return 0; }

private:
    SchemaPtr schema_;
    std::shared_ptr<FakeCalls> calls_;
    std::vector<WriteResponse> pending_;
};

// Client handing out FakeBulkWriters. Set the failure knobs before passing
// the client to factory_for().
class FakeIngestClient : public IIngestClient {
public:
    explicit FakeIngestClient(std::shared_ptr<FakeCalls> calls) : calls_(std::move(calls)) {}

    std::optional<std::size_t> fail_on_batch;
    bool fail_drain = false;
    std::optional<std::size_t> fail_on_insert;

    Result<std::unique_ptr<IBulkWriter>> create_bulk_writer(
            SchemaPtr schema, BulkWriteOptions) override {
        ++calls_->writers_created;
        auto writer = std::make_unique<FakeBulkWriter>(std::move(schema), calls_);
        writer->fail_on_batch = fail_on_batch;
        writer->fail_drain = fail_drain;
        return writer;
    }

    asio::awaitable<Result<uint64_t>> insert(InsertRequest request) override {
        if (fail_on_insert && *fail_on_insert == calls_->insert_sizes.size() + 1) {
            co_return make_error(ErrorCode::InsertFailed, "injected insert failure");
        }
        calls_->insert_sizes.push_back(request.rows.size());
        co_return request.rows.size();
    }

private:
    std::shared_ptr<FakeCalls> calls_;
};

// Factory that hands out `client` once; ownership moves to the engine.
inline ClientFactory factory_for(std::unique_ptr<IIngestClient> client) {
    auto holder = std::make_shared<std::unique_ptr<IIngestClient>>(std::move(client));
    return [holder](std::string_view, std::string_view) -> Result<std::unique_ptr<IIngestClient>> {
        if (!*holder) return make_error(ErrorCode::ConnectionFailed, "client already taken");
        return std::move(*holder);
    };
}

// Provider over `count` rows of (ts TimestampMillisecond, host String,
// value Int64).
class CountingProvider : public ITableDataProvider, public IApiDataProvider {
public:
    explicit CountingProvider(std::size_t count) : count_(count) {}

    bool fail_init = false;
    bool fail_close = false;
    int init_calls = 0;
    int close_calls = 0;

    std::string name() const override { return "counting"; }

    Result<void> init() override {
        ++init_calls;
        if (fail_init) return make_error(ErrorCode::ProviderInitFailed, "no data");
        return {};
    }

    std::size_t row_count() const override { return count_; }

    Result<void> close() override {
        ++close_calls;
        if (fail_close) return make_error(ErrorCode::ProviderCloseFailed, "busy");
        return {};
    }

    TableSchema table_schema() const override {
        return *TableSchema::builder()
            .name("metrics")
            .add_timestamp("ts", DataType::TimestampMillisecond)
            .add_tag("host", DataType::String)
            .add_field("value", DataType::Int64)
            .build();
    }

    std::unique_ptr<RowCursor> rows() override {
        return std::make_unique<Cursor>(*this);
    }

    std::string table_name() const override { return "metrics"; }

    std::vector<WireColumnSchema> api_schema() const override {
        return to_wire_schema(table_schema());
    }

    std::unique_ptr<WireRowCursor> api_rows() override {
        return std::make_unique<ApiCursor>(*this);
    }

    std::size_t pulled() const { return next_; }

private:
    static Row make_row(std::size_t i) {
        return Row::with_capacity(3)
            .add_value(Value::timestamp_millisecond(1'700'000'000'000 + static_cast<int64_t>(i)))
            .add_value(Value::string("host-" + std::to_string(i % 4)))
            .add_value(Value::int64(static_cast<int64_t>(i)));
    }

    class Cursor : public RowCursor {
    public:
        explicit Cursor(CountingProvider& p) : p_(p) {}
        std::optional<Row> next() override {
            if (p_.next_ >= p_.count_) return std::nullopt;
            return make_row(p_.next_++);
        }

    private:
        CountingProvider& p_;
    };

    class ApiCursor : public WireRowCursor {
    public:
        explicit ApiCursor(CountingProvider& p) : p_(p), schema_(p.table_schema()) {}
        std::optional<WireRow> next() override {
            if (pos_ >= p_.count_) return std::nullopt;
            auto wire_row = to_wire_row(make_row(pos_++), schema_);
            if (!wire_row) return std::nullopt;
            return std::move(*wire_row);
        }

    private:
        CountingProvider& p_;
        TableSchema schema_;
        std::size_t pos_ = 0;
    };

    std::size_t count_;
    std::size_t next_ = 0;
};

// Runs `task` to completion on `ctx` and returns its result.
template <typename T>
T run_to_completion(asio::io_context& ctx, asio::awaitable<T> task) {
    std::optional<T> out;
    asio::co_spawn(ctx, std::move(task), [&out](std::exception_ptr ep, T value) {
        if (ep) std::rethrow_exception(ep);
        out = std::move(value);
    });
    ctx.run();
    return std::move(*out);
}

}  // namespace tsingest::testing
