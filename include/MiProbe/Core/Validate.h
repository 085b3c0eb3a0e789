#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for MiProbe
 *
 * All checks throw ValidationException with a consistent message format:
 *   "<function>: <param> must be > 0, got <value>"
 */

#include <MiProbe/Core/Export.h>
#include <MiProbe/Core/Exception.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>

namespace Mi::Probe::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int32_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Value Range Validation
// =============================================================================

/**
 * @brief Validate value is positive (> 0)
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (!(value > T(0))) {
        throw ValidationException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate real value is finite (not NaN / inf)
 */
inline void RequireFinite(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw ValidationException(
            std::string(funcName) + ": " + paramName + " must be finite");
    }
}

/**
 * @brief Validate string is non-empty
 */
inline void RequireNonEmpty(const std::string& value, const char* paramName,
                            const char* funcName) {
    if (value.empty()) {
        throw ValidationException(
            std::string(funcName) + ": " + paramName + " must not be empty");
    }
}

} // namespace Mi::Probe::Validate
