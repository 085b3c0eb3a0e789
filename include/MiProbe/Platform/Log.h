#pragma once

/**
 * @file Log.h
 * @brief Leveled logging
 *
 * Usage:
 * @code
 * Log::SetLevel(LogLevel::Debug);
 * Log::Info("Project saved: " + path);
 *
 * // Capture output (tests, host application)
 * Log::SetSink([](LogLevel level, const std::string& message) { ... });
 * @endcode
 *
 * The default sink writes "<ISO time> [LEVEL] message" to stderr.
 */

#include <MiProbe/Core/Export.h>

#include <functional>
#include <string>

namespace Mi::Probe::Platform {

/**
 * @brief Log severity, ordered
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off         ///< Suppress all output
};

/**
 * @brief Get upper-case level tag ("DEBUG", "INFO", ...)
 */
MIPROBE_API const char* LogLevelName(LogLevel level);

/**
 * @brief Parse level name (case-insensitive)
 * @return false if name is not a level
 */
MIPROBE_API bool ParseLogLevel(const std::string& name, LogLevel& level);

class MIPROBE_API Log {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static void SetLevel(LogLevel level);
    static LogLevel Level();

    /// Replace output sink; an empty function restores the stderr sink
    static void SetSink(Sink sink);

    static bool IsEnabled(LogLevel level);

    static void Write(LogLevel level, const std::string& message);

    static void Debug(const std::string& message) { Write(LogLevel::Debug, message); }
    static void Info(const std::string& message) { Write(LogLevel::Info, message); }
    static void Warning(const std::string& message) { Write(LogLevel::Warning, message); }
    static void Error(const std::string& message) { Write(LogLevel::Error, message); }
};

} // namespace Mi::Probe::Platform
