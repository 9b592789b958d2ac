// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/config/ConfigResolver.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <vector>

namespace corral::config {

namespace {

constexpr std::string_view kBlank = " \t\r\n";

std::string_view strip(std::string_view text) {
    const auto first = text.find_first_not_of(kBlank);
    if (first == std::string_view::npos) {
        return {};
    }
    return text.substr(first, text.find_last_not_of(kBlank) - first + 1);
}

/// Drops a trailing `# comment` that is not inside a quoted value.
std::string_view withoutComment(std::string_view line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string_view unquote(std::string_view value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

const std::string* lookup(const FlatConfig& values, std::string_view section,
                          std::string_view key) {
    std::string full(section);
    full += '.';
    full += key;
    auto it = values.find(full);
    return it == values.end() ? nullptr : &it->second;
}

template <typename T, typename Parse>
void assign(const FlatConfig& values, std::string_view section, std::string_view key, T& target,
            Parse parse) {
    const auto* raw = lookup(values, section, key);
    if (!raw) {
        return;
    }
    if (auto parsed = parse(*raw)) {
        target = static_cast<T>(*parsed);
    } else {
        spdlog::warn("[Config] ignoring invalid value '{}' for {}.{}", *raw, section, key);
    }
}

} // namespace

bool ConfigResolver::envTruthy(const char* value) {
    if (value == nullptr) {
        return false;
    }
    const auto text = strip(value);
    constexpr std::array<std::string_view, 5> kFalsy{"", "0", "false", "off", "no"};
    return std::none_of(kFalsy.begin(), kFalsy.end(), [&](std::string_view word) {
        return word.size() == text.size() &&
               std::equal(word.begin(), word.end(), text.begin(), [](char a, char b) {
                   return a == std::tolower(static_cast<unsigned char>(b));
               });
    });
}

std::filesystem::path ConfigResolver::resolveDefaultConfigPath() {
    namespace fs = std::filesystem;
    std::vector<fs::path> candidates;
    if (const char* explicitPath = std::getenv("CORRAL_CONFIG"); explicitPath && *explicitPath) {
        candidates.emplace_back(explicitPath);
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        candidates.push_back(fs::path(xdg) / "corral" / "config.toml");
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        candidates.push_back(fs::path(home) / ".config" / "corral" / "config.toml");
    }

    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return {};
}

FlatConfig ConfigResolver::readFlatConfig(const std::filesystem::path& path) {
    FlatConfig values;
    std::ifstream in(path);
    if (!in) {
        return values;
    }

    std::string prefix;
    std::string raw;
    std::size_t lineNo = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        const auto line = strip(withoutComment(raw));
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[') {
            if (line.back() != ']') {
                spdlog::warn("[Config] {}:{}: unterminated section header", path.string(), lineNo);
                continue;
            }
            const auto name = strip(line.substr(1, line.size() - 2));
            prefix = name.empty() ? std::string{} : std::string(name) + ".";
            continue;
        }
        const auto eq = line.find('=');
        const auto key = eq == std::string_view::npos ? std::string_view{} : strip(line.substr(0, eq));
        if (key.empty()) {
            spdlog::warn("[Config] {}:{}: expected key = value", path.string(), lineNo);
            continue;
        }
        values.insert_or_assign(prefix + std::string(key),
                                std::string(unquote(strip(line.substr(eq + 1)))));
    }
    return values;
}

std::optional<std::uint64_t> ConfigResolver::parseUnsigned(std::string_view text) {
    std::uint64_t out = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return out;
}

std::optional<double> ConfigResolver::parseDouble(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string copy(text);
    char* end = nullptr;
    const double value = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::chrono::milliseconds> ConfigResolver::parseDuration(std::string_view text) {
    std::string_view digits = text;
    std::uint64_t scale = 1;
    if (text.ends_with("ms")) {
        digits = text.substr(0, text.size() - 2);
    } else if (text.ends_with("s")) {
        digits = text.substr(0, text.size() - 1);
        scale = 1000;
    } else if (text.ends_with("m")) {
        digits = text.substr(0, text.size() - 1);
        scale = 60 * 1000;
    }
    auto value = parseUnsigned(digits);
    if (!value) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(*value * scale));
}

pool::PoolConfig ConfigResolver::resolvePoolConfig(const FlatConfig& values,
                                                   std::string_view section,
                                                   pool::PoolConfig base) {
    auto num = [](const std::string& s) { return parseUnsigned(s); };
    auto dur = [](const std::string& s) { return parseDuration(s); };
    auto dbl = [](const std::string& s) { return parseDouble(s); };
    auto str = [](const std::string& s) { return std::optional<std::string>(s); };

    assign(values, section, "memory_per_worker_mb", base.memoryPerWorkerMb, num);
    assign(values, section, "min_workers", base.minWorkers, num);
    assign(values, section, "max_workers", base.maxWorkers, num);
    assign(values, section, "pre_warm_count", base.preWarmCount, num);
    assign(values, section, "queue_capacity", base.queueCapacity, num);
    assign(values, section, "idle_timeout", base.idleTimeout, dur);
    assign(values, section, "health_probe_interval", base.healthProbeInterval, dur);
    assign(values, section, "health_stale_after", base.healthStaleAfter, dur);
    assign(values, section, "load_timeout", base.loadTimeout, dur);
    assign(values, section, "wait_timeout", base.waitForWorkersTimeout, dur);
    assign(values, section, "device", base.device.device, str);
    assign(values, section, "threads", base.device.threads, num);
    assign(values, section, "dtype", base.device.dtype, str);

    const std::string breaker = std::string(section) + ".breaker";
    assign(values, breaker, "failure_ratio", base.breaker.failureRatio, dbl);
    assign(values, breaker, "minimum_requests", base.breaker.minimumRequests, num);
    assign(values, breaker, "window", base.breaker.window, dur);
    assign(values, breaker, "cooldown", base.breaker.cooldown, dur);
    assign(values, breaker, "half_open_trials", base.breaker.halfOpenMaxTrials, num);
    return base;
}

pool::RegistryConfig ConfigResolver::resolveRegistryConfig(const FlatConfig& values) {
    pool::RegistryConfig config;
    auto num = [](const std::string& s) { return parseUnsigned(s); };
    auto flag = [](const std::string& s) { return std::optional<bool>(envTruthy(s.c_str())); };

    assign(values, "registry", "memory_budget_mb", config.memoryBudgetMb, num);
    assign(values, "registry", "maintenance_threads", config.maintenanceThreads, num);
    assign(values, "registry", "maintenance", config.enableMaintenance, flag);
    config.defaultPool = resolvePoolConfig(values, "pool", config.defaultPool);

    // Environment override wins
    if (const char* env = std::getenv("CORRAL_MEMORY_BUDGET_MB")) {
        if (auto v = parseUnsigned(env)) {
            config.memoryBudgetMb = *v;
        }
    }
    if (const char* env = std::getenv("CORRAL_MAINTENANCE_THREADS")) {
        if (auto v = parseUnsigned(env)) {
            config.maintenanceThreads = static_cast<std::size_t>(*v);
        }
    }
    if (envTruthy(std::getenv("CORRAL_DISABLE_MAINTENANCE"))) {
        config.enableMaintenance = false;
    }
    if (const char* env = std::getenv("CORRAL_WAIT_TIMEOUT_MS")) {
        if (auto v = parseDuration(env)) {
            config.defaultPool.waitForWorkersTimeout = *v;
        }
    }
    return config;
}

logging::LoggingConfig ConfigResolver::resolveLoggingConfig(const FlatConfig& values) {
    logging::LoggingConfig config;
    auto num = [](const std::string& s) { return parseUnsigned(s); };
    auto str = [](const std::string& s) { return std::optional<std::string>(s); };

    assign(values, "logging", "level", config.level, str);
    if (const auto* file = lookup(values, "logging", "file")) {
        config.file = *file;
    }
    assign(values, "logging", "max_size_mb", config.maxFileSizeMb, num);
    assign(values, "logging", "max_files", config.maxFiles, num);

    if (const char* env = std::getenv("CORRAL_LOG_LEVEL"); env && *env) {
        config.level = env;
    }
    if (const char* env = std::getenv("CORRAL_LOG_FILE"); env && *env) {
        config.file = env;
    }
    return config;
}

pool::RegistryConfig ConfigResolver::loadRegistryConfig() {
    const auto path = resolveDefaultConfigPath();
    FlatConfig values;
    if (!path.empty()) {
        values = readFlatConfig(path);
        spdlog::debug("[Config] loaded {} keys from {}", values.size(), path.string());
    }
    return resolveRegistryConfig(values);
}

} // namespace corral::config
