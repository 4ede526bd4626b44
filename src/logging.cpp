// SPDX-License-Identifier: MIT

#include "tsingest/logging.hpp"
#include <spdlog/sinks/ansicolor_sink.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace tsingest {

namespace {

constexpr const char* kLoggerName = "tsingest";
constexpr const char* kConsoleFormat = "[%T.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_logger() {
    auto sink = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(
        spdlog::color_mode::automatic);
    sink->set_pattern(kConsoleFormat);
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    logger->set_level(spdlog::level::info);
    return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger>& log() {
    static std::shared_ptr<spdlog::logger> logger = make_logger();
    return logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    std::string x{name};
    std::transform(x.begin(), x.end(), x.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (x == "quiet") return spdlog::level::off;
    if (x == "critical") return spdlog::level::critical;
    if (x == "error") return spdlog::level::err;
    if (x == "warning" || x == "warn") return spdlog::level::warn;
    if (x == "info") return spdlog::level::info;
    if (x == "debug") return spdlog::level::debug;
    if (x == "trace") return spdlog::level::trace;
    return std::nullopt;
}

bool set_log_level(std::string_view name) {
    auto level = parse_log_level(name);
    if (!level) return false;
    log()->set_level(*level);
    return true;
}

}  // namespace tsingest
