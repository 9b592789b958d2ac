// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/core/types.h>

#include <spdlog/common.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace corral::logging {

struct LoggingConfig {
    std::string level = "info";  ///< trace|debug|info|warn|error|off
    std::filesystem::path file;  ///< Empty: log to stderr
    std::size_t maxFileSizeMb = 10;
    std::size_t maxFiles = 5;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

/// Unknown names fall back to `fallback`.
spdlog::level::level_enum parseLevel(std::string_view name,
                                     spdlog::level::level_enum fallback = spdlog::level::info);

/// Installs the `corral` logger as the spdlog default (rotating file sink
/// when a file is configured, colored stderr otherwise).
Result<void> configure(const LoggingConfig& config);

} // namespace corral::logging
