// SPDX-License-Identifier: MIT

#include "tsingest/config.hpp"
#include "tsingest/logging.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace tsingest {

namespace {

std::string lowercase(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void read_size(const IngestConfig::Getter& get, std::string_view key, std::size_t& out) {
    auto raw = get(key);
    if (!raw) return;
    std::size_t v = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), v);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
        log()->warn("{}='{}' is not a non-negative integer, using {}", key, *raw, out);
        return;
    }
    out = v;
}

}  // namespace

CompressionType parse_compression(std::string_view name) {
    auto x = lowercase(name);
    if (x == "none" || x == "false" || x == "0") return CompressionType::None;
    if (x == "lz4") return CompressionType::Lz4;
    if (x == "zstd") return CompressionType::Zstd;
    log()->warn("unknown compression '{}', using lz4", name);
    return CompressionType::Lz4;
}

IngestConfig IngestConfig::from_env(const Getter& get) {
    IngestConfig cfg;
    if (auto v = get("INGEST_ENDPOINT")) cfg.endpoint = *v;
    if (auto v = get("INGEST_DBNAME")) cfg.dbname = *v;
    read_size(get, "TABLE_ROW_COUNT", cfg.table_row_count);
    read_size(get, "BATCH_SIZE", cfg.batch_size);
    read_size(get, "PARALLELISM", cfg.parallelism);
    if (cfg.parallelism == 0) cfg.parallelism = 1;
    if (auto v = get("COMPRESSION")) cfg.compression = parse_compression(*v);
    read_size(get, "RECONCILE_INTERVAL", cfg.reconcile_interval);
    if (auto v = get("LOG_LEVEL")) cfg.log_level = *v;
    return cfg;
}

IngestConfig IngestConfig::from_env() {
    return from_env([](std::string_view key) -> std::optional<std::string> {
        const char* v = std::getenv(std::string{key}.c_str());
        if (!v) return std::nullopt;
        return std::string{v};
    });
}

BulkWriteOptions IngestConfig::bulk_options() const {
    return BulkWriteOptions{}
        .with_compression(compression)
        .with_parallelism(parallelism)
        .with_timeout(write_timeout);
}

}  // namespace tsingest
