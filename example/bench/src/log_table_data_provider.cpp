// SPDX-License-Identifier: MIT

#include "bench/log_table_data_provider.hpp"
#include "bench/log_text_generator.hpp"
#include "tsingest/logging.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <random>
#include <string_view>

namespace bench {

using tsingest::DataType;
using tsingest::Row;
using tsingest::Value;
using tsingest::WireRow;

namespace {

constexpr std::array<std::string_view, 36> kNameSuffixes = {
    "alpha", "beta", "gamma", "delta", "epsilon", "zeta", "eta", "theta",
    "iota", "kappa", "lambda", "mu", "nu", "xi", "omicron", "pi",
    "rho", "sigma", "tau", "upsilon", "phi", "chi", "psi", "omega",
    "prime", "secondary", "tertiary", "main", "backup", "standby", "primary", "replica",
    "master", "worker", "node", "edge",
};

constexpr std::string_view kLogSource = "application";
constexpr std::string_view kVersion = "v1.0.0";

// String columns after "ts", in schema order.
constexpr std::array<std::string_view, 18> kStringColumns = {
    "log_uid", "log_message", "log_level",
    "host_id", "host_name", "service_id", "service_name",
    "container_id", "container_name", "pod_id", "pod_name",
    "cluster_id", "cluster_name",
    "trace_id", "span_id", "user_id", "session_id", "request_id",
};

std::string name_suffix(std::size_t seed) {
    return fmt::format("{}{}", kNameSuffixes[seed % kNameSuffixes.size()], seed % 1000);
}

}  // namespace

class LogTableDataProvider::TableCursor : public tsingest::RowCursor {
public:
    explicit TableCursor(LogTableDataProvider& provider) : provider_(provider) {}

    std::optional<Row> next() override { return provider_.generate_row(); }

private:
    LogTableDataProvider& provider_;
};

// Drives the provider's generator from its own position, restoring the
// provider's position after each pull.
class LogTableDataProvider::ApiCursor : public tsingest::WireRowCursor {
public:
    explicit ApiCursor(LogTableDataProvider& provider) : provider_(provider) {}

    std::optional<WireRow> next() override {
        auto saved = provider_.current_row_;
        provider_.current_row_ = current_row_;
        auto row = provider_.generate_api_row();
        current_row_ = provider_.current_row_;
        provider_.current_row_ = saved;
        return row;
    }

private:
    LogTableDataProvider& provider_;
    std::size_t current_row_ = 0;
};

LogTableDataProvider::LogTableDataProvider(LogTableOptions options)
    : options_(std::move(options)) {}

tsingest::Result<void> LogTableDataProvider::init() {
    if (options_.table_name.empty()) {
        return tsingest::make_error(tsingest::ErrorCode::ProviderInitFailed,
                                    "log table needs a name");
    }

    base_time_ = options_.base_time_ms.value_or(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    uint64_t seed = options_.seed.value_or(std::random_device{}());
    std::mt19937_64 rng(seed);
    LogTextGenerator text(seed ^ 0x9e3779b97f4a7c15ULL);

    std::size_t pool = std::min(kMaxPoolSize, options_.row_count * 2);
    tsingest::log()->info("{}: pre-generating {} pool values", name(), pool);
    auto start = std::chrono::steady_clock::now();

    auto fill = [pool](std::vector<std::string>& out, auto make) {
        out.clear();
        out.reserve(pool);
        for (std::size_t i = 0; i < pool; ++i) out.push_back(make(i));
    };
    auto prefixed_id = [&rng](std::string_view prefix) {
        return [&rng, prefix](std::size_t i) {
            return fmt::format("{}-{}", prefix, rng() % 100000 + i);
        };
    };
    auto random_id = [&rng](std::string_view prefix) {
        return [&rng, prefix](std::size_t) { return fmt::format("{}_{}", prefix, rng()); };
    };

    fill(host_ids_, prefixed_id("host"));
    fill(host_names_, [](std::size_t i) { return name_suffix(i); });
    fill(service_ids_, prefixed_id("service"));
    fill(service_names_, [](std::size_t i) { return name_suffix(i + 1000); });
    fill(container_ids_, prefixed_id("container"));
    fill(container_names_, [](std::size_t i) { return name_suffix(i + 2000); });
    fill(pod_ids_, prefixed_id("pod"));
    fill(pod_names_, [](std::size_t i) { return name_suffix(i + 3000); });
    fill(cluster_ids_, prefixed_id("cluster"));
    fill(cluster_names_, [](std::size_t i) { return name_suffix(i + 4000); });

    fill(trace_ids_, random_id("trace"));
    fill(span_ids_, random_id("span"));
    fill(user_ids_, [&rng](std::size_t) {
        return fmt::format("user_{}", rng() % 9999 + 1);
    });
    fill(session_ids_, random_id("session"));
    fill(request_ids_, random_id("req"));

    fill(log_uids_, [this](std::size_t i) {
        return fmt::format("log_{}_{}", base_time_ + static_cast<int64_t>(i), i);
    });

    log_levels_.clear();
    log_messages_.clear();
    log_levels_.reserve(pool);
    log_messages_.reserve(pool);
    for (std::size_t i = 0; i < pool; ++i) {
        auto entry = text.generate(options_.message_length);
        log_levels_.push_back(std::move(entry.level));
        log_messages_.push_back(std::move(entry.message));
    }

    current_row_ = 0;
    initialized_ = true;
    tsingest::log()->info("{}: pre-generation took {}ms", name(),
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    return {};
}

tsingest::Result<void> LogTableDataProvider::close() {
    initialized_ = false;
    for (auto* pool : {&host_ids_, &host_names_, &service_ids_, &service_names_,
                       &container_ids_, &container_names_, &pod_ids_, &pod_names_,
                       &cluster_ids_, &cluster_names_, &trace_ids_, &span_ids_,
                       &user_ids_, &session_ids_, &request_ids_, &log_uids_,
                       &log_levels_, &log_messages_}) {
        pool->clear();
        pool->shrink_to_fit();
    }
    return {};
}

tsingest::TableSchema LogTableDataProvider::table_schema() const {
    auto builder = tsingest::TableSchema::builder();
    builder.name(options_.table_name).add_timestamp("ts", DataType::TimestampMillisecond);
    for (std::size_t i = 0; i < kStringColumns.size(); ++i) {
        builder.add_field(std::string{kStringColumns[i]}, DataType::String, false);
    }
    builder.add_field("response_time_ms", DataType::Int64, false)
        .add_field("log_source", DataType::String, false)
        .add_field("version", DataType::String, false);
    // name() is always set, so build() cannot fail here.
    return *builder.build();
}

std::vector<tsingest::WireColumnSchema> LogTableDataProvider::api_schema() const {
    return tsingest::to_wire_schema(table_schema());
}

std::unique_ptr<tsingest::RowCursor> LogTableDataProvider::rows() {
    return std::make_unique<TableCursor>(*this);
}

std::unique_ptr<tsingest::WireRowCursor> LogTableDataProvider::api_rows() {
    return std::make_unique<ApiCursor>(*this);
}

std::optional<LogTableDataProvider::LogRecord> LogTableDataProvider::compose(
        std::size_t row) const {
    if (!initialized_ || row >= options_.row_count || host_ids_.empty()) {
        return std::nullopt;
    }
    const std::size_t pool = host_ids_.size();
    const std::size_t base = row % pool;
    const std::size_t offset = (row * 7 + 13) % pool;
    const std::size_t i1 = base;
    const std::size_t i2 = (base + 1) % pool;
    const std::size_t i3 = (base + 2) % pool;
    const std::size_t i4 = (base + 3) % pool;
    const std::size_t i5 = (base + 4) % pool;
    const std::size_t entry = row % log_messages_.size();

    return LogRecord{
        .ts = base_time_ + static_cast<int64_t>(row) + static_cast<int64_t>(offset % 2000) - 1000,
        .fields = {
            &log_uids_[base], &log_messages_[entry], &log_levels_[entry],
            &host_ids_[i1], &host_names_[i1],
            &service_ids_[i2], &service_names_[i2],
            &container_ids_[i3], &container_names_[i3],
            &pod_ids_[i4], &pod_names_[i4],
            &cluster_ids_[i5], &cluster_names_[i5],
            &trace_ids_[i1], &span_ids_[i2], &user_ids_[i3],
            &session_ids_[i4], &request_ids_[i5],
        },
        .response_time_ms = static_cast<int64_t>(base % 999 + 1),
    };
}

std::optional<Row> LogTableDataProvider::generate_row() {
    auto rec = compose(current_row_);
    if (!rec) return std::nullopt;
    ++current_row_;

    auto row = Row::with_capacity(kColumnCount);
    row.add_value(Value::timestamp_millisecond(rec->ts));
    for (const auto* field : rec->fields) {
        row.add_value(Value::string(*field));
    }
    row.add_value(Value::int64(rec->response_time_ms))
        .add_value(Value::string(std::string{kLogSource}))
        .add_value(Value::string(std::string{kVersion}));
    return row;
}

std::optional<WireRow> LogTableDataProvider::generate_api_row() {
    namespace wire = tsingest::wire;
    auto rec = compose(current_row_);
    if (!rec) return std::nullopt;
    ++current_row_;

    WireRow row;
    row.values.reserve(kColumnCount);
    row.values.push_back(wire::timestamp_millisecond_value(rec->ts));
    for (const auto* field : rec->fields) {
        row.values.push_back(wire::string_value(*field));
    }
    row.values.push_back(wire::i64_value(rec->response_time_ms));
    row.values.push_back(wire::string_value(std::string{kLogSource}));
    row.values.push_back(wire::string_value(std::string{kVersion}));
    return row;
}

}  // namespace bench
