// SPDX-License-Identifier: MIT

#include "bench/log_text_generator.hpp"
#include <array>
#include <string_view>

namespace bench {

namespace {

constexpr std::array<std::string_view, 8> kComponents = {
    "[http]", "[db]", "[cache]", "[auth]", "[scheduler]", "[queue]", "[storage]", "[rpc]",
};

constexpr std::array<std::string_view, 32> kWords = {
    "request", "response", "handled", "user", "session", "timeout", "retry", "connection",
    "established", "closed", "query", "executed", "rows", "latency", "ms", "upstream",
    "downstream", "payload", "bytes", "accepted", "rejected", "token", "refreshed", "cache",
    "miss", "hit", "shard", "replica", "leader", "elected", "flushed", "compacted",
};

std::string_view pick_level(std::mt19937_64& rng) {
    auto roll = std::uniform_int_distribution<int>(0, 99)(rng);
    if (roll < 60) return "INFO";
    if (roll < 80) return "DEBUG";
    if (roll < 95) return "WARN";
    return "ERROR";
}

}  // namespace

LogEntry LogTextGenerator::generate(std::size_t length) {
    LogEntry entry;
    entry.level = pick_level(rng_);

    std::uniform_int_distribution<std::size_t> component(0, kComponents.size() - 1);
    std::uniform_int_distribution<std::size_t> word(0, kWords.size() - 1);

    std::string& msg = entry.message;
    msg.reserve(length + 16);
    msg += kComponents[component(rng_)];
    while (msg.size() < length) {
        msg += ' ';
        msg += kWords[word(rng_)];
    }
    msg.resize(length);
    return entry;
}

}  // namespace bench
