#pragma once

/**
 * @file Comparison.h
 * @brief Reference vs. test board divergence report
 *
 * Per point with both readings:
 * - |ref| > zeroThreshold: diffPercent = |cmp - ref| / |ref| * 100
 * - |ref| <= zeroThreshold: diffPercent = 0 when cmp is also zero,
 *   else +infinity (Divergent regardless of tolerance)
 * - Divergent if diffPercent > tolerancePercent, else Ok
 * - Both readings carry a unit and the units differ: Divergent with
 *   unitMismatch set and no difference values (readings are not comparable)
 *
 * Points missing either reading are Incomplete; they only fail the report in
 * strict mode.
 *
 * Compute() is pure: same project content, same report.
 */

#include <MiProbe/Core/Export.h>
#include <MiProbe/Model/Project.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Mi::Probe::Comparison {

// =============================================================================
// Enumerations
// =============================================================================

enum class PointStatus {
    Ok,             ///< Within tolerance
    Divergent,      ///< Exceeds tolerance (or reference is zero and test is not)
    Incomplete      ///< Reference or test reading missing
};

MIPROBE_API const char* PointStatusName(PointStatus status);

// =============================================================================
// Parameters
// =============================================================================

struct MIPROBE_API ComparisonParams {
    bool strict = false;            ///< Incomplete points fail the report
    double zeroThreshold = 0.0;     ///< |value| <= threshold counts as zero

    ComparisonParams& SetStrict(bool s) { strict = s; return *this; }
    ComparisonParams& SetZeroThreshold(double t) { zeroThreshold = t; return *this; }
};

// =============================================================================
// Results
// =============================================================================

/**
 * @brief Comparison of one point
 */
struct MIPROBE_API PointComparison {
    int32_t pointId = 0;
    std::string label;                      ///< Point display name
    std::optional<double> referenceValue;
    std::optional<double> compareValue;
    std::string referenceUnit;
    std::string compareUnit;

    /// Both units known and different
    bool unitMismatch = false;

    /// |cmp - ref| / |ref| * 100, +inf for zero reference; empty when Incomplete
    /// or on unit mismatch
    std::optional<double> diffPercent;

    /// Signed (cmp - ref) / |ref| * 100; empty when Incomplete
    std::optional<double> differencePercent;

    /// cmp - ref; empty when Incomplete
    std::optional<double> differenceAbsolute;

    PointStatus status = PointStatus::Incomplete;
};

/**
 * @brief Immutable comparison result for a whole project
 */
struct MIPROBE_API ComparisonReport {
    std::vector<PointComparison> entries;   ///< Project point order
    double tolerancePercent = DEFAULT_TOLERANCE_PERCENT;
    bool strict = false;
    bool overallPass = true;

    size_t okCount = 0;
    size_t divergentCount = 0;
    size_t incompleteCount = 0;

    /// Entry for pointId, nullptr if absent
    const PointComparison* Find(int32_t pointId) const;

    /// Divergent entries in project order
    std::vector<PointComparison> DivergentEntries() const;
};

using ComparisonReportPtr = std::shared_ptr<const ComparisonReport>;

/**
 * @brief Aggregate statistics derived from a report
 */
struct MIPROBE_API ComparisonSummary {
    size_t totalPoints = 0;
    size_t measuredPoints = 0;      ///< Both readings present
    size_t okPoints = 0;
    size_t divergentPoints = 0;
    size_t incompletePoints = 0;

    double progressPercent = 0.0;   ///< measured / total * 100
    double passRatePercent = 0.0;   ///< ok / measured * 100

    std::optional<double> referenceMin;
    std::optional<double> referenceMax;
    std::optional<double> referenceAverage;
    std::optional<double> compareMin;
    std::optional<double> compareMax;
    std::optional<double> compareAverage;
};

// =============================================================================
// Functions
// =============================================================================

/**
 * @brief Compute the divergence report
 *
 * @param data Project content (see Project::Snapshot)
 * @param params Strict mode and zero threshold
 * @return Report with one entry per point, in project order
 */
MIPROBE_API ComparisonReport Compute(const ProjectData& data,
                                     const ComparisonParams& params = ComparisonParams());

/// Compute on a consistent snapshot of project
MIPROBE_API ComparisonReport Compute(const Project& project,
                                     const ComparisonParams& params = ComparisonParams());

/**
 * @brief Compare a single pair of readings
 */
MIPROBE_API PointStatus ComparePair(double reference, double compare,
                                    double tolerancePercent, double zeroThreshold,
                                    double& diffPercent);

MIPROBE_API ComparisonSummary Summarize(const ComparisonReport& report);

/**
 * @brief Render the report as a fixed-width text table
 */
MIPROBE_API std::string FormatReport(const ComparisonReport& report);

} // namespace Mi::Probe::Comparison
