#include <MiProbe/Comparison/Comparison.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace Mi::Probe::Comparison {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

struct RunningStats {
    size_t count = 0;
    double sum = 0.0;
    double minVal = INF;
    double maxVal = -INF;

    void Add(double v) {
        ++count;
        sum += v;
        minVal = std::min(minVal, v);
        maxVal = std::max(maxVal, v);
    }
};

std::string FormatNumber(const std::optional<double>& value, const char* fmt) {
    if (!value) {
        return "-";
    }
    if (std::isinf(*value)) {
        return *value > 0 ? "inf" : "-inf";
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), fmt, *value);
    return buf;
}

} // anonymous namespace

const char* PointStatusName(PointStatus status) {
    switch (status) {
        case PointStatus::Ok:         return "OK";
        case PointStatus::Divergent:  return "DIVERGENT";
        case PointStatus::Incomplete: return "INCOMPLETE";
    }
    return "UNKNOWN";
}

// =============================================================================
// ComparisonReport
// =============================================================================

const PointComparison* ComparisonReport::Find(int32_t pointId) const {
    for (const auto& entry : entries) {
        if (entry.pointId == pointId) {
            return &entry;
        }
    }
    return nullptr;
}

std::vector<PointComparison> ComparisonReport::DivergentEntries() const {
    std::vector<PointComparison> result;
    for (const auto& entry : entries) {
        if (entry.status == PointStatus::Divergent) {
            result.push_back(entry);
        }
    }
    return result;
}

// =============================================================================
// Compute
// =============================================================================

PointStatus ComparePair(double reference, double compare,
                        double tolerancePercent, double zeroThreshold,
                        double& diffPercent) {
    if (std::abs(reference) <= zeroThreshold) {
        if (std::abs(compare) <= zeroThreshold) {
            diffPercent = 0.0;
            return PointStatus::Ok;
        }
        diffPercent = INF;
        return PointStatus::Divergent;
    }

    diffPercent = std::abs(compare - reference) / std::abs(reference) * 100.0;
    return diffPercent > tolerancePercent ? PointStatus::Divergent : PointStatus::Ok;
}

ComparisonReport Compute(const ProjectData& data, const ComparisonParams& params) {
    ComparisonReport report;
    report.tolerancePercent = data.tolerancePercent;
    report.strict = params.strict;
    report.entries.reserve(data.points.size());

    for (const auto& point : data.points) {
        PointComparison entry;
        entry.pointId = point.id;
        entry.label = point.DisplayName();
        entry.referenceValue = point.referenceValue;
        entry.compareValue = point.compareValue;
        entry.referenceUnit = point.referenceUnit;
        entry.compareUnit = point.compareUnit;
        entry.unitMismatch = !point.referenceUnit.empty() && !point.compareUnit.empty() &&
                             point.referenceUnit != point.compareUnit;

        if (point.IsMeasured() && entry.unitMismatch) {
            entry.status = PointStatus::Divergent;
        } else if (point.IsMeasured()) {
            double ref = *point.referenceValue;
            double cmp = *point.compareValue;
            double diff = 0.0;
            entry.status = ComparePair(ref, cmp, data.tolerancePercent,
                                       params.zeroThreshold, diff);
            entry.diffPercent = diff;
            entry.differenceAbsolute = cmp - ref;

            if (std::abs(ref) <= params.zeroThreshold) {
                entry.differencePercent = (diff == 0.0) ? 0.0 : std::copysign(INF, cmp);
            } else {
                entry.differencePercent = (cmp - ref) / std::abs(ref) * 100.0;
            }
        } else {
            entry.status = PointStatus::Incomplete;
        }

        switch (entry.status) {
            case PointStatus::Ok:         ++report.okCount; break;
            case PointStatus::Divergent:  ++report.divergentCount; break;
            case PointStatus::Incomplete: ++report.incompleteCount; break;
        }
        report.entries.push_back(std::move(entry));
    }

    report.overallPass = report.divergentCount == 0 &&
                         (!params.strict || report.incompleteCount == 0);
    return report;
}

ComparisonReport Compute(const Project& project, const ComparisonParams& params) {
    return Compute(project.Snapshot(), params);
}

// =============================================================================
// Summary
// =============================================================================

ComparisonSummary Summarize(const ComparisonReport& report) {
    ComparisonSummary summary;
    summary.totalPoints = report.entries.size();
    summary.okPoints = report.okCount;
    summary.divergentPoints = report.divergentCount;
    summary.incompletePoints = report.incompleteCount;
    summary.measuredPoints = report.okCount + report.divergentCount;

    if (summary.totalPoints > 0) {
        summary.progressPercent = 100.0 * static_cast<double>(summary.measuredPoints) /
                                  static_cast<double>(summary.totalPoints);
    }
    if (summary.measuredPoints > 0) {
        summary.passRatePercent = 100.0 * static_cast<double>(summary.okPoints) /
                                  static_cast<double>(summary.measuredPoints);
    }

    RunningStats refStats, cmpStats;
    for (const auto& entry : report.entries) {
        if (entry.referenceValue) refStats.Add(*entry.referenceValue);
        if (entry.compareValue) cmpStats.Add(*entry.compareValue);
    }

    if (refStats.count > 0) {
        summary.referenceMin = refStats.minVal;
        summary.referenceMax = refStats.maxVal;
        summary.referenceAverage = refStats.sum / static_cast<double>(refStats.count);
    }
    if (cmpStats.count > 0) {
        summary.compareMin = cmpStats.minVal;
        summary.compareMax = cmpStats.maxVal;
        summary.compareAverage = cmpStats.sum / static_cast<double>(cmpStats.count);
    }
    return summary;
}

// =============================================================================
// Formatting
// =============================================================================

std::string FormatReport(const ComparisonReport& report) {
    std::string out;
    char line[160];

    std::snprintf(line, sizeof(line), "%-6s %-24s %12s %12s %10s  %-10s\n",
                  "ID", "POINT", "REFERENCE", "TEST", "DIFF %", "STATUS");
    out += line;
    out += std::string(80, '-') + "\n";

    for (const auto& entry : report.entries) {
        std::string label = entry.label.size() > 24 ? entry.label.substr(0, 24) : entry.label;
        std::snprintf(line, sizeof(line), "%-6d %-24s %12s %12s %10s  %s",
                      entry.pointId, label.c_str(),
                      FormatNumber(entry.referenceValue, "%.4g").c_str(),
                      FormatNumber(entry.compareValue, "%.4g").c_str(),
                      FormatNumber(entry.diffPercent, "%.2f").c_str(),
                      PointStatusName(entry.status));
        out += line;
        if (entry.unitMismatch) {
            out += " (unit " + entry.referenceUnit + " vs " + entry.compareUnit + ")";
        }
        out += "\n";
    }

    out += std::string(80, '-') + "\n";
    std::snprintf(line, sizeof(line),
                  "tolerance %.2f%%  ok %zu  divergent %zu  incomplete %zu  %s%s\n",
                  report.tolerancePercent, report.okCount, report.divergentCount,
                  report.incompleteCount, report.overallPass ? "PASS" : "FAIL",
                  report.strict ? " (strict)" : "");
    out += line;
    return out;
}

} // namespace Mi::Probe::Comparison
