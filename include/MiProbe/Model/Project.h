#pragma once

/**
 * @file Project.h
 * @brief Board project: metadata, photograph and ordered measurement points
 *
 * Project is state-agnostic: it enforces data invariants only. Which
 * operations are legal when is decided by WorkflowController.
 *
 * Thread safety: every member locks the project's own mutex, so a save
 * running on one thread and an acquisition writing a reading on another are
 * serialized. Readers get copies, never references into the project.
 */

#include <MiProbe/Core/Export.h>
#include <MiProbe/Core/Types.h>
#include <MiProbe/IO/BoardImage.h>
#include <MiProbe/Model/Point.h>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Mi::Probe {

// =============================================================================
// Constants
// =============================================================================

/// Default divergence threshold (percent)
constexpr double DEFAULT_TOLERANCE_PERCENT = 5.0;

/// Maximum number of points per project
constexpr size_t MAX_POINTS = 1000;

/// Largest point id a project hands out or accepts
constexpr int32_t MAX_POINT_ID = INT32_MAX - 1;

// =============================================================================
// Data
// =============================================================================

/**
 * @brief Descriptive project fields
 */
struct MIPROBE_API ProjectInfo {
    std::string name;                           ///< Non-empty
    std::string boardModel = "Unknown model";   ///< Free text
    std::string description;
    bool isFullyFunctional = true;              ///< Reference board passed manual inspection

    bool operator==(const ProjectInfo& other) const {
        return name == other.name && boardModel == other.boardModel &&
               description == other.description &&
               isFullyFunctional == other.isFullyFunctional;
    }
};

/**
 * @brief Complete project content, as captured by Project::Snapshot()
 */
struct MIPROBE_API ProjectData {
    ProjectInfo info;
    double tolerancePercent = DEFAULT_TOLERANCE_PERCENT;
    std::vector<Point> points;          ///< Insertion order
    BoardImage image;
    Timestamp createdAt{};
    Timestamp modifiedAt{};
    int32_t nextPointId = 1;
};

// =============================================================================
// Project
// =============================================================================

class MIPROBE_API Project {
public:
    /**
     * @brief Create an empty project
     * @param name Non-empty project name
     * @param image Board photograph (may be empty until SetImage)
     * @throws ValidationException if name is empty
     */
    explicit Project(const std::string& name, BoardImage image = {});

    /**
     * @brief Restore a project from previously captured data
     *
     * Validates name, tolerance, point invariants, id uniqueness and bounds.
     * nextPointId is raised above the highest point id if needed. Point ids
     * and nextPointId above MAX_POINT_ID are rejected.
     *
     * @throws ValidationException
     */
    explicit Project(ProjectData data);

    /// Copy constructor (deep copy, fresh lock)
    Project(const Project& other);

    /// Move constructor
    Project(Project&& other);

    Project& operator=(const Project& other);
    Project& operator=(Project&& other);

    ~Project() = default;

    // =========================================================================
    // Metadata
    // =========================================================================

    ProjectInfo Info() const;
    std::string Name() const;

    /// @throws ValidationException if info.name is empty
    void SetInfo(const ProjectInfo& info);

    double TolerancePercent() const;

    /// @throws ValidationException unless tolerance is finite and > 0
    void SetTolerancePercent(double tolerance);

    Timestamp CreatedAt() const;
    Timestamp ModifiedAt() const;

    /**
     * @brief Mutation counter, incremented by every successful change
     *
     * Used to detect stale derived data (comparison reports).
     */
    uint64_t Revision() const;

    // =========================================================================
    // Image
    // =========================================================================

    bool HasImage() const;
    int32_t ImageWidth() const;
    int32_t ImageHeight() const;

    /// Copy of the photograph
    BoardImage Image() const;

    /**
     * @brief Replace the photograph
     * @throws ValidationException if an existing point falls outside the new image
     */
    void SetImage(BoardImage image);

    // =========================================================================
    // Points
    // =========================================================================

    size_t PointCount() const;
    bool HasPoint(int32_t id) const;

    /// Copies of all points, insertion order
    std::vector<Point> Points() const;

    /// Point ids, insertion order
    std::vector<int32_t> PointIds() const;

    std::optional<Point> FindPoint(int32_t id) const;

    /// @throws ValidationException if id is unknown
    Point GetPoint(int32_t id) const;

    /**
     * @brief Add a point
     *
     * The id and timestamps of point are replaced: the project assigns the
     * next free id and stamps createdAt/updatedAt.
     *
     * @return Assigned id
     * @throws ValidationException on invalid geometry, out-of-bounds position,
     *         missing image, or when MAX_POINTS is reached
     */
    int32_t AddPoint(Point point);

    /// @throws ValidationException if id is unknown
    void RemovePoint(int32_t id);

    /// Remove all points (ids keep increasing)
    void ClearPoints();

    /**
     * @brief Replace position, shape and size of a point
     *
     * Only x, y, shape, radius, width and height are taken from geometry.
     *
     * @throws ValidationException (point unchanged)
     */
    void SetPointGeometry(int32_t id, const Point& geometry);

    /**
     * @brief Replace name, description, componentType and expectedValue
     * @throws ValidationException if id is unknown
     */
    void SetPointInfo(int32_t id, const Point& info);

    /**
     * @brief Store a reading in the field selected by role
     * @throws ValidationException if id is unknown or value is not finite
     */
    void SetMeasurement(int32_t id, MeasurementRole role, double value,
                        const std::string& unit, Timestamp timestamp);

    /// Remove both readings of a point
    void ClearMeasurements(int32_t id);

    /**
     * @brief Point under (x, y), else the nearest centre within tolerance
     */
    std::optional<Point> FindPointAt(int32_t x, int32_t y,
                                     int32_t tolerance = DEFAULT_HIT_TOLERANCE) const;

    /// Points whose centre lies inside the rectangle spanned by two corners
    std::vector<Point> PointsInArea(int32_t x1, int32_t y1, int32_t x2, int32_t y2) const;

    // =========================================================================
    // Snapshot
    // =========================================================================

    /// Consistent copy of the whole project taken under one lock
    ProjectData Snapshot() const;

private:
    Point* FindLocked(int32_t id);
    const Point* FindLocked(int32_t id) const;
    void TouchLocked(Timestamp ts);

    mutable std::mutex mutex_;
    ProjectData data_;
    uint64_t revision_ = 0;
};

} // namespace Mi::Probe
