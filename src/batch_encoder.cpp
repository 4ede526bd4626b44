// SPDX-License-Identifier: MIT

#include "tsingest/batch_encoder.hpp"
#include <bit>
#include <string>
#include <type_traits>

namespace tsingest {

namespace {

void put_string(const std::string& s, ByteBuffer& buf) {
    buf.put_int32_be(static_cast<int32_t>(s.size()));
    buf.put_bytes(std::as_bytes(std::span{s.data(), s.size()}));
}

void encode_value(const Value& value, ByteBuffer& buf) {
    std::visit([&buf](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            buf.put_int32_be(-1);
        } else if constexpr (std::is_same_v<T, bool>) {
            buf.put_int32_be(1);
            buf.put_byte(std::byte{v ? uint8_t{1} : uint8_t{0}});
        } else if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, uint8_t>) {
            buf.put_int32_be(1);
            buf.put_byte(static_cast<std::byte>(v));
        } else if constexpr (std::is_same_v<T, int16_t> || std::is_same_v<T, uint16_t>) {
            buf.put_int32_be(2);
            buf.put_int16_be(static_cast<int16_t>(v));
        } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, uint32_t>) {
            buf.put_int32_be(4);
            buf.put_int32_be(static_cast<int32_t>(v));
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
            buf.put_int32_be(8);
            buf.put_int64_be(static_cast<int64_t>(v));
        } else if constexpr (std::is_same_v<T, float>) {
            buf.put_int32_be(4);
            buf.put_int32_be(std::bit_cast<int32_t>(v));
        } else if constexpr (std::is_same_v<T, double>) {
            buf.put_int32_be(8);
            buf.put_int64_be(std::bit_cast<int64_t>(v));
        } else if constexpr (std::is_same_v<T, Int128>) {
            auto bits = static_cast<unsigned __int128>(v);
            buf.put_int32_be(16);
            buf.put_int64_be(static_cast<int64_t>(bits >> 64));
            buf.put_int64_be(static_cast<int64_t>(static_cast<uint64_t>(bits)));
        } else if constexpr (std::is_same_v<T, std::string>) {
            put_string(v, buf);
        } else if constexpr (std::is_same_v<T, Bytes>) {
            buf.put_int32_be(static_cast<int32_t>(v.size()));
            buf.put_bytes(std::span<const uint8_t>{v});
        }
    }, value.storage());
}

}  // namespace

void BatchEncoder::write_header(ByteBuffer& buf) const {
    static constexpr std::byte magic[] = {
        std::byte{'T'}, std::byte{'S'}, std::byte{'B'}, std::byte{'A'},
        std::byte{'T'}, std::byte{'C'}, std::byte{'H'}, std::byte{'\n'},
    };
    buf.put_bytes(magic);

    buf.put_int32_be(static_cast<int32_t>(schema_.column_count()));
    for (const auto& col : schema_.columns()) {
        buf.put_int16_be(static_cast<int16_t>(col.data_type));
        buf.put_int16_be(static_cast<int16_t>(col.semantic_type));
        put_string(col.name, buf);
    }
}

void BatchEncoder::encode_row(const Row& row, ByteBuffer& buf) const {
    buf.put_int16_be(static_cast<int16_t>(row.size()));
    for (const auto& v : row.values()) {
        encode_value(v, buf);
    }
}

void BatchEncoder::write_trailer(ByteBuffer& buf) const {
    // -1 as int16_t signals end of data
    buf.put_int16_be(-1);
}

void BatchEncoder::encode(const RowBuffer& batch, ByteBuffer& buf) const {
    buf.reserve(buf.size() + batch.estimated_bytes() +
                batch.size() * (2 + 4 * schema_.column_count()));
    write_header(buf);
    for (const auto& row : batch.rows()) {
        encode_row(row, buf);
    }
    write_trailer(buf);
}

}  // namespace tsingest
