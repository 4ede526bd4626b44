// SPDX-License-Identifier: MIT

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string_view>

namespace tsingest {

// The "tsingest" logger. Created on first use with a colour stderr sink at
// info level.
std::shared_ptr<spdlog::logger>& log();

// Accepts trace, debug, info, warning, error, critical or quiet
// (case-insensitive).
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

// Returns false and keeps the current level when `name` is unknown.
bool set_log_level(std::string_view name);

}  // namespace tsingest
