// SPDX-License-Identifier: MIT

#include "tsingest/value.hpp"
#include <fmt/ranges.h>
#include <algorithm>

namespace tsingest {

namespace {

std::string int128_to_string(Int128 v) {
    if (v == 0) return "0";
    bool negative = v < 0;
    // Work on the unsigned magnitude so INT128_MIN does not overflow.
    unsigned __int128 mag = negative ? static_cast<unsigned __int128>(-(v + 1)) + 1
                                     : static_cast<unsigned __int128>(v);
    std::string out;
    while (mag != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (negative) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

}  // namespace

std::size_t Value::estimated_size() const {
    return std::visit([](const auto& v) -> std::size_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return 1;
        } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, Bytes>) {
            return v.size();
        } else {
            return sizeof(T);
        }
    }, data_);
}

std::string to_string(const Value& value) {
    if (value.is_null()) return "Null";
    auto name = data_type_name(value.type());
    return std::visit([name](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "Null";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return fmt::format("{}(\"{}\")", name, v);
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return fmt::format("{}([{}])", name, fmt::join(v, ", "));
        } else if constexpr (std::is_same_v<T, Int128>) {
            return fmt::format("{}({})", name, int128_to_string(v));
        } else if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, uint8_t>) {
            // Print small integers as numbers, not characters.
            return fmt::format("{}({})", name, static_cast<int>(v));
        } else {
            return fmt::format("{}({})", name, v);
        }
    }, value.storage());
}

}  // namespace tsingest
