#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for MiProbe
 */

#include <MiProbe/Core/Export.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace Mi::Probe {

// =============================================================================
// Time
// =============================================================================

/// Wall-clock timestamp with millisecond resolution (the persisted precision)
using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::milliseconds>;

/**
 * @brief Current wall-clock time truncated to milliseconds
 */
MIPROBE_API Timestamp Now();

/**
 * @brief Milliseconds since Unix epoch
 */
inline int64_t ToEpochMs(Timestamp ts) {
    return ts.time_since_epoch().count();
}

/**
 * @brief Timestamp from milliseconds since Unix epoch
 */
inline Timestamp FromEpochMs(int64_t ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

/**
 * @brief Format timestamp as ISO-8601 UTC with milliseconds
 *
 * Example: "2026-10-16T09:41:07.123Z"
 */
MIPROBE_API std::string FormatTimestamp(Timestamp ts);

// =============================================================================
// Measurement Role
// =============================================================================

/**
 * @brief Board a reading was taken from
 *
 * Decides which point field an acquisition writes.
 */
enum class MeasurementRole {
    Reference,  ///< Golden sample, writes Point::referenceValue
    Test        ///< Board under inspection, writes Point::compareValue
};

/**
 * @brief Get lowercase role name ("reference" / "test")
 */
inline const char* RoleName(MeasurementRole role) {
    return role == MeasurementRole::Reference ? "reference" : "test";
}

// =============================================================================
// Point Shape
// =============================================================================

/**
 * @brief Marker shape drawn over the board photograph
 */
enum class PointShape {
    Circle,     ///< Sized by radius
    Rectangle   ///< Sized by width and height
};

/**
 * @brief Get lowercase shape name ("circle" / "rectangle")
 */
inline const char* ShapeName(PointShape shape) {
    return shape == PointShape::Circle ? "circle" : "rectangle";
}

} // namespace Mi::Probe
