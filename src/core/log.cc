#include "core/log.h"

#include <array>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>

namespace railyard::core {
namespace {

constexpr const char* kLogLevelEnvVar = "RAILYARD_LOG_LEVEL";

struct LevelAlias {
    std::string_view name;
    LogLevel level;
};

constexpr std::array<LevelAlias, 12> kLevelAliases{{
    {"error", LogLevel::Error},
    {"err", LogLevel::Error},
    {"0", LogLevel::Error},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"1", LogLevel::Warn},
    {"info", LogLevel::Info},
    {"2", LogLevel::Info},
    {"debug", LogLevel::Debug},
    {"3", LogLevel::Debug},
    {"trace", LogLevel::Trace},
    {"4", LogLevel::Trace},
}};

std::atomic<LogLevel> g_logLevel{LogLevel::Info};
std::once_flag g_envInitOnce;
std::mutex g_logWriteMutex;

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        const auto l = static_cast<unsigned char>(lhs[i]);
        const auto r = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(l) != std::tolower(r)) {
            return false;
        }
    }
    return true;
}

bool routesToStderr(LogLevel level) {
    return level == LogLevel::Error || level == LogLevel::Warn;
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    for (const LevelAlias& alias : kLevelAliases) {
        if (equalsIgnoreCase(alias.name, text)) {
            return alias.level;
        }
    }
    return std::nullopt;
}

std::string_view logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Trace:
        return "trace";
    }
    return "info";
}

std::string formatLogLine(
    LogLevel level,
    std::string_view category,
    std::string_view message,
    std::chrono::system_clock::time_point when
) {
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch());
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&seconds, &local);

    char clock[16]{};
    std::snprintf(
        clock,
        sizeof(clock),
        "%02d:%02d:%02d.%03d",
        local.tm_hour,
        local.tm_min,
        local.tm_sec,
        static_cast<int>(sinceEpoch.count() % 1000));

    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.remove_suffix(1);
    }

    std::string line;
    line.reserve(message.size() + category.size() + 32);
    line.append("[").append(clock).append("]");
    if (!category.empty()) {
        line.append("[").append(category).append("]");
    }
    line.append("[").append(logLevelName(level)).append("] ");
    line.append(message);
    return line;
}

void setLogLevel(LogLevel level) {
    // Consume the environment first so it cannot override this call later.
    initializeLogLevelFromEnvironment();
    g_logLevel.store(level);
}

LogLevel logLevel() {
    initializeLogLevelFromEnvironment();
    return g_logLevel.load();
}

bool shouldLog(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(logLevel());
}

void initializeLogLevelFromEnvironment() {
    std::call_once(g_envInitOnce, []() {
        const char* value = std::getenv(kLogLevelEnvVar);
        if (value == nullptr || value[0] == '\0') {
            return;
        }
        g_logLevel.store(parseLogLevel(value).value_or(LogLevel::Info));
    });
}

LogLine::LogLine(LogLevel level, std::string_view category)
    : m_level(level), m_category(category) {}

LogLine::~LogLine() {
    const std::string line = formatLogLine(m_level, m_category, m_stream.str(), std::chrono::system_clock::now());
    std::lock_guard<std::mutex> lock(g_logWriteMutex);
    std::ostream& out = routesToStderr(m_level) ? std::cerr : std::cout;
    out << line << '\n';
}

std::ostream& LogLine::stream() {
    return m_stream;
}

} // namespace railyard::core
