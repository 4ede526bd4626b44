// SPDX-License-Identifier: MIT

#include "tsingest/byte_buffer.hpp"
#include <bit>

namespace tsingest {

void ByteBuffer::put_int16_be(int16_t val) {
    if constexpr (std::endian::native == std::endian::little) {
        val = static_cast<int16_t>(__builtin_bswap16(static_cast<uint16_t>(val)));
    }
    auto* bytes = reinterpret_cast<const std::byte*>(&val);
    data_.insert(data_.end(), bytes, bytes + 2);
}

void ByteBuffer::put_int32_be(int32_t val) {
    if constexpr (std::endian::native == std::endian::little) {
        val = static_cast<int32_t>(__builtin_bswap32(static_cast<uint32_t>(val)));
    }
    auto* bytes = reinterpret_cast<const std::byte*>(&val);
    data_.insert(data_.end(), bytes, bytes + 4);
}

void ByteBuffer::put_int64_be(int64_t val) {
    if constexpr (std::endian::native == std::endian::little) {
        val = static_cast<int64_t>(__builtin_bswap64(static_cast<uint64_t>(val)));
    }
    auto* bytes = reinterpret_cast<const std::byte*>(&val);
    data_.insert(data_.end(), bytes, bytes + 8);
}

void ByteBuffer::put_byte(std::byte b) {
    data_.push_back(b);
}

void ByteBuffer::put_bytes(std::span<const std::byte> data) {
    data_.insert(data_.end(), data.begin(), data.end());
}

void ByteBuffer::put_bytes(std::span<const uint8_t> data) {
    put_bytes(std::as_bytes(data));
}

}  // namespace tsingest
