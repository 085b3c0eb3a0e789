#include <MiProbe/Config/Settings.h>
#include <MiProbe/Core/Exception.h>
#include <MiProbe/Platform/FileIO.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <map>

namespace Mi::Probe {

using Platform::Log;
using Platform::TrimString;

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool ParseInt(const std::string& text, int32_t& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || parsed < INT32_MIN || parsed > INT32_MAX) {
        return false;
    }
    value = static_cast<int32_t>(parsed);
    return true;
}

bool ParseDouble(const std::string& text, double& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(text.c_str(), &end);
    if (*end != '\0' || errno == ERANGE || !std::isfinite(parsed)) {
        return false;
    }
    value = parsed;
    return true;
}

bool ParseBool(const std::string& text, bool& value) {
    std::string lower = ToLower(text);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        value = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        value = false;
        return true;
    }
    return false;
}

bool ParseParity(const std::string& text, Serial::Parity& parity) {
    std::string lower = ToLower(text);
    if (lower == "none") { parity = Serial::Parity::None; return true; }
    if (lower == "odd")  { parity = Serial::Parity::Odd;  return true; }
    if (lower == "even") { parity = Serial::Parity::Even; return true; }
    return false;
}

bool ParseBackoff(const std::string& text, BackoffMode& mode) {
    std::string lower = ToLower(text);
    if (lower == "linear")      { mode = BackoffMode::Linear;      return true; }
    if (lower == "exponential") { mode = BackoffMode::Exponential; return true; }
    return false;
}

/// Applies one value; returns false if the value does not parse
using KeyHandler = std::function<bool(Settings&, const std::string&)>;

const std::map<std::string, KeyHandler>& KeyHandlers() {
    static const std::map<std::string, KeyHandler> handlers = {
        {"serial.device", [](Settings& s, const std::string& v) {
            s.serial.devicePath = v;
            return !v.empty();
        }},
        {"serial.baud_rate", [](Settings& s, const std::string& v) {
            return ParseInt(v, s.serial.baudRate);
        }},
        {"serial.parity", [](Settings& s, const std::string& v) {
            return ParseParity(v, s.serial.parity);
        }},
        {"serial.data_bits", [](Settings& s, const std::string& v) {
            return ParseInt(v, s.serial.dataBits);
        }},
        {"serial.stop_bits", [](Settings& s, const std::string& v) {
            return ParseInt(v, s.serial.stopBits);
        }},
        {"acquisition.timeout_ms", [](Settings& s, const std::string& v) {
            return ParseInt(v, s.acquisition.timeoutMs);
        }},
        {"acquisition.max_retries", [](Settings& s, const std::string& v) {
            return ParseInt(v, s.acquisition.maxRetries);
        }},
        {"acquisition.backoff", [](Settings& s, const std::string& v) {
            return ParseBackoff(v, s.acquisition.backoff);
        }},
        {"acquisition.backoff_base_ms", [](Settings& s, const std::string& v) {
            return ParseInt(v, s.acquisition.backoffBaseMs);
        }},
        {"acquisition.poll_interval_ms", [](Settings& s, const std::string& v) {
            return ParseInt(v, s.acquisition.pollIntervalMs);
        }},
        {"comparison.strict", [](Settings& s, const std::string& v) {
            return ParseBool(v, s.comparison.strict);
        }},
        {"comparison.zero_threshold", [](Settings& s, const std::string& v) {
            return ParseDouble(v, s.comparison.zeroThreshold);
        }},
        {"project.default_tolerance_percent", [](Settings& s, const std::string& v) {
            return ParseDouble(v, s.defaultTolerancePercent);
        }},
        {"log.level", [](Settings& s, const std::string& v) {
            return Platform::ParseLogLevel(v, s.logLevel);
        }},
    };
    return handlers;
}

} // anonymous namespace

void Settings::Validate() const {
    serial.Validate();
    acquisition.Validate();
    if (!(comparison.zeroThreshold >= 0.0)) {
        throw InvalidArgumentException("comparison.zero_threshold must be >= 0");
    }
    if (!(defaultTolerancePercent > 0.0)) {
        throw InvalidArgumentException("project.default_tolerance_percent must be > 0");
    }
}

Settings ParseSettings(const std::vector<std::string>& lines) {
    Settings settings;
    const auto& handlers = KeyHandlers();

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string where = "settings line " + std::to_string(i + 1);
        std::string line = TrimString(lines[i]);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw InvalidArgumentException(where + ": expected 'key = value', got '" + line + "'");
        }

        std::string key = ToLower(TrimString(line.substr(0, eq)));
        std::string value = TrimString(line.substr(eq + 1));

        auto handler = handlers.find(key);
        if (handler == handlers.end()) {
            Log::Warning(where + ": ignoring unknown key '" + key + "'");
            continue;
        }
        if (!handler->second(settings, value)) {
            throw InvalidArgumentException(where + ": invalid value '" + value +
                                           "' for " + key);
        }
    }

    settings.Validate();
    return settings;
}

Settings LoadSettings(const std::string& path) {
    std::vector<std::string> lines;
    if (!Platform::ReadTextLines(path, lines, false)) {
        throw IOException("LoadSettings: failed to read file: " + path);
    }

    Settings settings = ParseSettings(lines);
    Log::Info("Loaded settings from " + path);
    return settings;
}

} // namespace Mi::Probe
