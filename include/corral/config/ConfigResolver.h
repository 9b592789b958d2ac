// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/logging/Logging.h>
#include <corral/pool/PoolConfig.h>
#include <corral/pool/Registry.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace corral::config {

using FlatConfig = std::map<std::string, std::string>;

/**
 * Static helpers that turn a flat TOML file plus CORRAL_* environment
 * variables into registry, pool and logging settings. Precedence:
 * environment > file > built-in defaults.
 */
class ConfigResolver {
public:
    ConfigResolver() = delete;

    /// False for null, blank, "0", "false", "off", "no" (any case).
    static bool envTruthy(const char* value);

    /// CORRAL_CONFIG, then $XDG_CONFIG_HOME/corral/config.toml, then
    /// ~/.config/corral/config.toml. Empty when none exists.
    static std::filesystem::path resolveDefaultConfigPath();

    /// Reads `key = value` lines into "section.key" entries. Handles `#`
    /// comments outside quotes and single or double quoted values; malformed
    /// lines are logged and skipped. A missing file yields an empty map.
    static FlatConfig readFlatConfig(const std::filesystem::path& path);

    /// "250ms", "30s", "5m", or a bare number of milliseconds.
    static std::optional<std::chrono::milliseconds> parseDuration(std::string_view text);
    static std::optional<std::uint64_t> parseUnsigned(std::string_view text);
    static std::optional<double> parseDouble(std::string_view text);

    /// Applies `<section>.*` and `<section>.breaker.*` keys on top of `base`.
    static pool::PoolConfig resolvePoolConfig(const FlatConfig& values, std::string_view section,
                                              pool::PoolConfig base = {});

    /// `[registry]` and `[pool]` keys plus environment overrides.
    static pool::RegistryConfig resolveRegistryConfig(const FlatConfig& values);

    /// `[logging]` keys plus CORRAL_LOG_LEVEL / CORRAL_LOG_FILE.
    static logging::LoggingConfig resolveLoggingConfig(const FlatConfig& values);

    /// resolveRegistryConfig(readFlatConfig(resolveDefaultConfigPath())).
    static pool::RegistryConfig loadRegistryConfig();
};

} // namespace corral::config
