// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/logging/Logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace corral::logging {

spdlog::level::level_enum parseLevel(std::string_view name, spdlog::level::level_enum fallback) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
        return spdlog::level::trace;
    if (lower == "debug")
        return spdlog::level::debug;
    if (lower == "info")
        return spdlog::level::info;
    if (lower == "warn" || lower == "warning")
        return spdlog::level::warn;
    if (lower == "error" || lower == "err")
        return spdlog::level::err;
    if (lower == "critical")
        return spdlog::level::critical;
    if (lower == "off")
        return spdlog::level::off;
    return fallback;
}

Result<void> configure(const LoggingConfig& config) {
    std::shared_ptr<spdlog::logger> logger;
    try {
        if (!config.file.empty()) {
            if (config.file.has_parent_path()) {
                std::filesystem::create_directories(config.file.parent_path());
            }
            const std::size_t maxSize = std::max<std::size_t>(1, config.maxFileSizeMb) * 1024 * 1024;
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file.string(), maxSize, std::max<std::size_t>(1, config.maxFiles));
            logger = std::make_shared<spdlog::logger>("corral", sink);
        } else {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            logger = std::make_shared<spdlog::logger>("corral", sink);
        }
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("cannot open log file '{}': {}", config.file.string(), e.what())};
    }

    logger->set_pattern(config.pattern);
    logger->set_level(parseLevel(config.level));
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::info);

    if (!config.file.empty()) {
        spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", config.file.string(),
                     config.maxFileSizeMb, config.maxFiles);
    }
    return {};
}

} // namespace corral::logging
