/**
 * @file Log.cpp
 * @brief Logging implementation
 */

#include <MiProbe/Platform/Log.h>
#include <MiProbe/Core/Types.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>

namespace Mi::Probe::Platform {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_sinkMutex;
Log::Sink g_sink;

void StderrSink(LogLevel level, const std::string& message) {
    std::string line = FormatTimestamp(Now()) + " [" + LogLevelName(level) + "] " +
                       message + "\n";
    std::fputs(line.c_str(), stderr);
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     return "OFF";
    }
    return "UNKNOWN";
}

bool ParseLogLevel(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") { level = LogLevel::Debug; return true; }
    if (lower == "info") { level = LogLevel::Info; return true; }
    if (lower == "warn" || lower == "warning") { level = LogLevel::Warning; return true; }
    if (lower == "error") { level = LogLevel::Error; return true; }
    if (lower == "off") { level = LogLevel::Off; return true; }
    return false;
}

void Log::SetLevel(LogLevel level) {
    g_level = level;
}

LogLevel Log::Level() {
    return g_level;
}

void Log::SetSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    g_sink = std::move(sink);
}

bool Log::IsEnabled(LogLevel level) {
    LogLevel current = g_level;
    return current != LogLevel::Off && level != LogLevel::Off && level >= current;
}

void Log::Write(LogLevel level, const std::string& message) {
    if (!IsEnabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_sinkMutex);
    if (g_sink) {
        g_sink(level, message);
    } else {
        StderrSink(level, message);
    }
}

} // namespace Mi::Probe::Platform
