// SPDX-License-Identifier: MIT

#include "bench/log_table_data_provider.hpp"
#include "bench/log_text_generator.hpp"
#include "tsingest/schema_validator.hpp"
#include <gtest/gtest.h>
#include <set>

namespace bench {
namespace {

using tsingest::DataType;
using tsingest::SemanticType;

constexpr int64_t kBaseTime = 1'700'000'000'000;

LogTableOptions small_table(std::size_t rows) {
    return LogTableOptions{
        .row_count = rows,
        .message_length = 200,
        .seed = 42,
        .base_time_ms = kBaseTime,
    };
}

TEST(LogTextGeneratorTest, ExactLength) {
    LogTextGenerator gen(7);
    for (std::size_t len : {1u, 10u, 200u, 1500u}) {
        auto entry = gen.generate(len);
        EXPECT_EQ(entry.message.size(), len);
    }
}

TEST(LogTextGeneratorTest, LevelsAreKnown) {
    LogTextGenerator gen(3);
    const std::set<std::string> known = {"INFO", "DEBUG", "WARN", "ERROR"};
    std::size_t info = 0;
    for (int i = 0; i < 1000; ++i) {
        auto entry = gen.generate(50);
        EXPECT_TRUE(known.contains(entry.level)) << entry.level;
        if (entry.level == "INFO") ++info;
    }
    // 60% expected
    EXPECT_GT(info, 450u);
    EXPECT_LT(info, 750u);
}

TEST(LogTextGeneratorTest, SameSeedSameText) {
    LogTextGenerator a(11);
    LogTextGenerator b(11);
    EXPECT_EQ(a.generate(300).message, b.generate(300).message);
}

TEST(LogTableDataProviderTest, Schema) {
    LogTableDataProvider provider(small_table(10));
    auto schema = provider.table_schema();

    EXPECT_EQ(schema.name(), "benchmark_logs");
    ASSERT_EQ(schema.column_count(), LogTableDataProvider::kColumnCount);
    EXPECT_EQ(schema.column(0).name, "ts");
    EXPECT_EQ(schema.column(0).data_type, DataType::TimestampMillisecond);
    EXPECT_EQ(schema.column(0).semantic_type, SemanticType::Timestamp);
    EXPECT_EQ(schema.column(1).name, "log_uid");
    EXPECT_EQ(schema.column(2).name, "log_message");
    EXPECT_EQ(schema.column(19).name, "response_time_ms");
    EXPECT_EQ(schema.column(19).data_type, DataType::Int64);
    EXPECT_EQ(schema.column(21).name, "version");
    for (const auto& col : schema.columns()) {
        EXPECT_FALSE(col.nullable) << col.name;
    }

    auto api = provider.api_schema();
    ASSERT_EQ(api.size(), LogTableDataProvider::kColumnCount);
    EXPECT_EQ(api[0].column_name, "ts");
    EXPECT_EQ(api[19].datatype, DataType::Int64);
}

TEST(LogTableDataProviderTest, SchemaPassesStrictCheck) {
    LogTableDataProvider provider(small_table(10));
    EXPECT_TRUE(tsingest::check_schema(provider.table_schema(),
                                       tsingest::SchemaCheck::Strict).has_value());
}

TEST(LogTableDataProviderTest, NoRowsBeforeInit) {
    LogTableDataProvider provider(small_table(10));
    EXPECT_FALSE(provider.rows()->next().has_value());
    EXPECT_FALSE(provider.api_rows()->next().has_value());
}

TEST(LogTableDataProviderTest, YieldsExactlyRowCount) {
    LogTableDataProvider provider(small_table(25));
    ASSERT_TRUE(provider.init().has_value());

    auto cursor = provider.rows();
    std::size_t n = 0;
    while (auto row = cursor->next()) {
        EXPECT_EQ(row->size(), LogTableDataProvider::kColumnCount);
        ++n;
    }
    EXPECT_EQ(n, 25u);
    EXPECT_FALSE(cursor->next().has_value());
    EXPECT_FALSE(cursor->next().has_value());
    // A fresh cursor continues from the provider's position.
    EXPECT_FALSE(provider.rows()->next().has_value());

    provider.reset();
    EXPECT_TRUE(provider.rows()->next().has_value());
}

TEST(LogTableDataProviderTest, PoolSize) {
    LogTableDataProvider small(small_table(30));
    ASSERT_TRUE(small.init().has_value());
    EXPECT_EQ(small.pool_size(), 60u);

    LogTableOptions large_options = small_table(20'000);
    large_options.message_length = 10;
    LogTableDataProvider large(large_options);
    ASSERT_TRUE(large.init().has_value());
    EXPECT_EQ(large.pool_size(), LogTableDataProvider::kMaxPoolSize);
}

TEST(LogTableDataProviderTest, RowContents) {
    LogTableDataProvider provider(small_table(50));
    ASSERT_TRUE(provider.init().has_value());
    EXPECT_EQ(provider.base_time(), kBaseTime);

    const std::size_t pool = provider.pool_size();
    auto cursor = provider.rows();
    for (std::size_t i = 0; i < 50; ++i) {
        auto row = cursor->next();
        ASSERT_TRUE(row.has_value());

        int64_t offset = static_cast<int64_t>(((i * 7 + 13) % pool) % 2000);
        EXPECT_EQ(row->get_timestamp(0), kBaseTime + static_cast<int64_t>(i) + offset - 1000);

        auto message = row->get_string(2);
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ(message->size(), 200u);

        auto response = row->get_i64(19);
        ASSERT_TRUE(response.has_value());
        EXPECT_EQ(*response, static_cast<int64_t>(i % pool % 999 + 1));

        EXPECT_EQ(row->get_string(20), "application");
        EXPECT_EQ(row->get_string(21), "v1.0.0");
    }
}

TEST(LogTableDataProviderTest, ApiRowsMatchTableRows) {
    LogTableDataProvider provider(small_table(5));
    ASSERT_TRUE(provider.init().has_value());

    auto table = provider.rows();
    auto api = provider.api_rows();
    auto schema = provider.table_schema();
    for (int i = 0; i < 5; ++i) {
        auto row = table->next();
        auto wire_row = api->next();
        ASSERT_TRUE(row.has_value());
        ASSERT_TRUE(wire_row.has_value());
        auto converted = tsingest::to_wire_row(std::move(*row), schema);
        ASSERT_TRUE(converted.has_value());
        EXPECT_EQ(converted->values, wire_row->values);
    }
}

TEST(LogTableDataProviderTest, AlternatingCursorsStayIndependent) {
    LogTableDataProvider provider(small_table(6));
    ASSERT_TRUE(provider.init().has_value());

    auto table = provider.rows();
    auto api = provider.api_rows();
    std::size_t table_rows = 0;
    std::size_t api_rows = 0;
    for (int i = 0; i < 10; ++i) {
        if (table->next()) ++table_rows;
        if (api->next()) ++api_rows;
        EXPECT_EQ(provider.current_row(), table_rows);
    }
    EXPECT_EQ(table_rows, 6u);
    EXPECT_EQ(api_rows, 6u);
}

TEST(LogTableDataProviderTest, CloseReleasesPools) {
    LogTableDataProvider provider(small_table(10));
    ASSERT_TRUE(provider.init().has_value());
    EXPECT_GT(provider.pool_size(), 0u);
    ASSERT_TRUE(provider.close().has_value());
    EXPECT_EQ(provider.pool_size(), 0u);
    EXPECT_FALSE(provider.rows()->next().has_value());
}

TEST(LogTableDataProviderTest, InitRejectsEmptyTableName) {
    auto options = small_table(10);
    options.table_name.clear();
    LogTableDataProvider provider(options);
    auto r = provider.init();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, tsingest::ErrorCode::ProviderInitFailed);
}

}  // namespace
}  // namespace bench
