#pragma once

#include <MiProbe/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for MiProbe
 */

#include <stdexcept>
#include <string>

namespace Mi::Probe {

/**
 * @brief Base exception class for MiProbe
 */
class MIPROBE_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception (API misuse, bad configuration value)
 */
class MIPROBE_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Invalid point geometry or project field
 */
class MIPROBE_API ValidationException : public Exception {
public:
    explicit ValidationException(const std::string& message)
        : Exception("Validation failed: " + message) {}
};

/**
 * @brief Illegal workflow transition or operation for the current state
 */
class MIPROBE_API StateException : public Exception {
public:
    explicit StateException(const std::string& message)
        : Exception("Illegal state: " + message) {}
};

/**
 * @brief Reason an acquisition was surfaced as failed
 */
enum class AcquisitionFailure {
    Timeout,                ///< No complete frame within timeout on the last attempt
    ChecksumMismatch,       ///< Frame arrived but its checksum did not match
    DeviceNotResponding,    ///< Write failed, device error frame, or malformed frame
    Cancelled               ///< Cancel observed before a reading was stored
};

/**
 * @brief Get display name for an acquisition failure
 */
inline const char* AcquisitionFailureName(AcquisitionFailure failure) {
    switch (failure) {
        case AcquisitionFailure::Timeout:             return "Timeout";
        case AcquisitionFailure::ChecksumMismatch:    return "ChecksumMismatch";
        case AcquisitionFailure::DeviceNotResponding: return "DeviceNotResponding";
        case AcquisitionFailure::Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

/**
 * @brief Acquisition failed after the configured retries (or was cancelled)
 */
class MIPROBE_API AcquisitionException : public Exception {
public:
    AcquisitionException(AcquisitionFailure failure, const std::string& message)
        : Exception(std::string("Acquisition ") + AcquisitionFailureName(failure) +
                    ": " + message)
        , failure_(failure) {}

    AcquisitionFailure Failure() const { return failure_; }

private:
    AcquisitionFailure failure_;
};

/**
 * @brief Unsupported or missing schema version, or missing container entry
 */
class MIPROBE_API FormatException : public Exception {
public:
    explicit FormatException(const std::string& message)
        : Exception("Format error: " + message) {}
};

/**
 * @brief Container failed its integrity check or is truncated
 */
class MIPROBE_API CorruptContainerException : public Exception {
public:
    explicit CorruptContainerException(const std::string& message)
        : Exception("Corrupt container: " + message) {}
};

/**
 * @brief File or device I/O exception
 */
class MIPROBE_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

} // namespace Mi::Probe
