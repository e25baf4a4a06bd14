#pragma once

#include <optional>
#include <string>

namespace quizconv::logging {

enum class LogLevel { kError = 0, kWarn, kInfo, kDebug };

// Reads QUIZCONV_LOG_LEVEL (error, warn, info, debug). Defaults to warn.
void InitializeFromEnvironment();
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
std::optional<LogLevel> ParseLogLevel(const std::string& value);

// Every level goes to stderr; stdout carries converted output.
void Log(LogLevel level, const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);

}  // namespace quizconv::logging
