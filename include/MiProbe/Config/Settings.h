#pragma once

/**
 * @file Settings.h
 * @brief Session settings loaded from a "key = value" file
 *
 * Example:
 * @code
 * # meter on the bench PC
 * serial.device = /dev/ttyUSB1
 * serial.baud_rate = 19200
 * acquisition.timeout_ms = 1500
 * acquisition.backoff = exponential
 * comparison.strict = true
 * project.default_tolerance_percent = 2.5
 * log.level = debug
 * @endcode
 *
 * Keys:
 *   serial.device, serial.baud_rate, serial.parity (none|odd|even),
 *   serial.data_bits, serial.stop_bits,
 *   acquisition.timeout_ms, acquisition.max_retries,
 *   acquisition.backoff (linear|exponential), acquisition.backoff_base_ms,
 *   acquisition.poll_interval_ms,
 *   comparison.strict (true|false), comparison.zero_threshold,
 *   project.default_tolerance_percent,
 *   log.level (debug|info|warning|error|off)
 *
 * Unknown keys are logged and ignored.
 */

#include <MiProbe/Acquisition/Acquisition.h>
#include <MiProbe/Comparison/Comparison.h>
#include <MiProbe/Core/Export.h>
#include <MiProbe/Model/Project.h>
#include <MiProbe/Platform/Log.h>
#include <MiProbe/Serial/SerialChannel.h>

#include <string>
#include <vector>

namespace Mi::Probe {

struct MIPROBE_API Settings {
    Serial::SerialConfig serial;
    AcquisitionParams acquisition;
    Comparison::ComparisonParams comparison;
    double defaultTolerancePercent = DEFAULT_TOLERANCE_PERCENT;
    Platform::LogLevel logLevel = Platform::LogLevel::Info;

    Settings& SetSerial(const Serial::SerialConfig& s) { serial = s; return *this; }
    Settings& SetAcquisition(const AcquisitionParams& a) { acquisition = a; return *this; }
    Settings& SetComparison(const Comparison::ComparisonParams& c) { comparison = c; return *this; }
    Settings& SetDefaultTolerancePercent(double t) { defaultTolerancePercent = t; return *this; }
    Settings& SetLogLevel(Platform::LogLevel l) { logLevel = l; return *this; }

    /// @throws InvalidArgumentException if any group is out of range
    void Validate() const;
};

/**
 * @brief Parse settings lines on top of the defaults
 * @throws InvalidArgumentException naming the 1-based line of a bad entry
 */
MIPROBE_API Settings ParseSettings(const std::vector<std::string>& lines);

/**
 * @brief Load and parse a settings file
 * @throws IOException if the file cannot be read
 * @throws InvalidArgumentException on a bad entry
 */
MIPROBE_API Settings LoadSettings(const std::string& path);

} // namespace Mi::Probe
