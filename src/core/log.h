#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

// Core Log subsystem
// Responsible for: leveled, categorized diagnostic lines for the track engine and demo.
// Should NOT do: structured tracing, file rotation, or user-facing error messages.
namespace railyard::core {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);
void initializeLogLevelFromEnvironment();

// Accepts level names ("warn", "warning", ...) or digits 0..4, case-insensitive.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text);
[[nodiscard]] std::string_view logLevelName(LogLevel level);

// "[HH:MM:SS.mmm][category][level] message" in local time. Trailing line breaks are dropped.
[[nodiscard]] std::string formatLogLine(
    LogLevel level,
    std::string_view category,
    std::string_view message,
    std::chrono::system_clock::time_point when
);

class LogLine {
public:
    LogLine(LogLevel level, std::string_view category);
    ~LogLine();

    [[nodiscard]] std::ostream& stream();

private:
    LogLevel m_level;
    std::string m_category;
    std::ostringstream m_stream;
};

} // namespace railyard::core

#define RY_LOG_STREAM(level, category) \
    if (!::railyard::core::shouldLog(level)) {} else ::railyard::core::LogLine((level), (category)).stream()

#define RY_LOGE(category) RY_LOG_STREAM(::railyard::core::LogLevel::Error, (category))
#define RY_LOGW(category) RY_LOG_STREAM(::railyard::core::LogLevel::Warn, (category))
#define RY_LOGI(category) RY_LOG_STREAM(::railyard::core::LogLevel::Info, (category))
#define RY_LOGD(category) RY_LOG_STREAM(::railyard::core::LogLevel::Debug, (category))
#define RY_LOGT(category) RY_LOG_STREAM(::railyard::core::LogLevel::Trace, (category))
