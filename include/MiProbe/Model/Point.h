#pragma once

/**
 * @file Point.h
 * @brief Measurement point marked on the board photograph
 *
 * A point is either:
 * - Circle: x, y, radius
 * - Rectangle: x, y, width, height (centred on x, y)
 *
 * and holds one reading per role:
 * - referenceValue: golden sample board
 * - compareValue:   board under inspection
 */

#include <MiProbe/Core/Export.h>
#include <MiProbe/Core/Types.h>

#include <cstdint>
#include <optional>
#include <string>

namespace Mi::Probe {

// =============================================================================
// Constants
// =============================================================================

/// Default marker size in pixels (radius, or width and height)
constexpr int32_t DEFAULT_POINT_SIZE = 20;

/// Default hit-test tolerance for FindPointAt (pixels)
constexpr int32_t DEFAULT_HIT_TOLERANCE = 10;

// =============================================================================
// Point
// =============================================================================

/**
 * @brief One measurement point
 *
 * Plain data; invariants are enforced by ValidatePoint() and by Project,
 * which owns every point and only hands out copies.
 */
struct MIPROBE_API Point {
    // Identification (unique within project, never changes)
    int32_t id = 0;

    // Position on the image (pixels)
    int32_t x = 0;
    int32_t y = 0;

    // Shape and size; the set of present size fields must match the shape
    PointShape shape = PointShape::Circle;
    std::optional<int32_t> radius;      ///< Circle only
    std::optional<int32_t> width;       ///< Rectangle only
    std::optional<int32_t> height;      ///< Rectangle only

    // Readings (never derived)
    std::optional<double> referenceValue;
    std::optional<double> compareValue;
    std::string referenceUnit;          ///< Unit reported with referenceValue
    std::string compareUnit;            ///< Unit reported with compareValue

    // Optional description
    std::string name;
    std::string description;
    std::string componentType;          ///< e.g. "resistor", "capacitor"
    std::string expectedValue;          ///< e.g. "10k", "100uF"

    // Timestamps
    Timestamp createdAt{};
    Timestamp updatedAt{};
    std::optional<Timestamp> measuredAt;

    // =========================================================================
    // Factories
    // =========================================================================

    /// Circle marker (id is assigned by Project::AddPoint)
    static Point MakeCircle(int32_t x, int32_t y, int32_t radius = DEFAULT_POINT_SIZE);

    /// Rectangle marker (id is assigned by Project::AddPoint)
    static Point MakeRectangle(int32_t x, int32_t y,
                               int32_t width = DEFAULT_POINT_SIZE,
                               int32_t height = DEFAULT_POINT_SIZE);

    // =========================================================================
    // State
    // =========================================================================

    bool HasReference() const { return referenceValue.has_value(); }
    bool HasCompare() const { return compareValue.has_value(); }

    /// Both readings present
    bool IsMeasured() const { return HasReference() && HasCompare(); }

    /// Reading stored for role
    std::optional<double> Value(MeasurementRole role) const {
        return role == MeasurementRole::Reference ? referenceValue : compareValue;
    }

    /// Unit stored for role (empty if unknown)
    const std::string& Unit(MeasurementRole role) const {
        return role == MeasurementRole::Reference ? referenceUnit : compareUnit;
    }

    // =========================================================================
    // Geometry
    // =========================================================================

    /// Marker area in pixels^2 (0 if size is missing)
    double Area() const;

    /// Check if pixel (px, py) lies inside the marker
    bool Contains(int32_t px, int32_t py) const;

    // =========================================================================
    // Display
    // =========================================================================

    /// "#3: R12" when named, "Point #3" otherwise
    std::string DisplayName() const;

    /// "r=20px" or "30x12px"
    std::string SizeText() const;

    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const { return !(*this == other); }
};

// =============================================================================
// Validation
// =============================================================================

/**
 * @brief Check shape/size invariants and stored readings
 *
 * - circle: radius present and > 0, width/height absent
 * - rectangle: width and height present and > 0, radius absent
 * - readings, when present, are finite
 *
 * @throws ValidationException
 */
MIPROBE_API void ValidateGeometry(const Point& point);

/**
 * @brief ValidateGeometry() plus image bounds on (x, y)
 *
 * @param imageWidth Current image width (coordinates must be in [0, width))
 * @param imageHeight Current image height
 * @throws ValidationException
 */
MIPROBE_API void ValidatePoint(const Point& point, int32_t imageWidth, int32_t imageHeight);

} // namespace Mi::Probe
