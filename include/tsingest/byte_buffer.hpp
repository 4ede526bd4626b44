// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tsingest {

// Growable byte buffer with big-endian writers, used to encode batches.
class ByteBuffer {
public:
    void put_int16_be(int16_t val);
    void put_int32_be(int32_t val);
    void put_int64_be(int64_t val);
    void put_byte(std::byte b);
    void put_bytes(std::span<const std::byte> data);
    void put_bytes(std::span<const uint8_t> data);

    void reserve(std::size_t n) { data_.reserve(n); }

    std::span<const std::byte> view() const { return data_; }
    void clear() { data_.clear(); }
    std::size_t size() const { return data_.size(); }

private:
    std::vector<std::byte> data_;
};

}  // namespace tsingest
