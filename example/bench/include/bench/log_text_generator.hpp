// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace bench {

struct LogEntry {
    std::string level;
    std::string message;
};

// Synthetic application log lines.
//
// Levels are drawn with INFO 60%, DEBUG 20%, WARN 15%, ERROR 5%. Messages
// start with a component tag and continue with vocabulary words until they
// are exactly the requested length.
class LogTextGenerator {
public:
    explicit LogTextGenerator(uint64_t seed) : rng_(seed) {}

    LogEntry generate(std::size_t length);

private:
    std::mt19937_64 rng_;
};

}  // namespace bench
