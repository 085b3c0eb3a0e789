#include <MiProbe/Model/Project.h>
#include <MiProbe/Core/Exception.h>
#include <MiProbe/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace Mi::Probe {

namespace {

void RequireTolerance(double tolerance, const char* funcName) {
    Validate::RequireFinite(tolerance, "tolerancePercent", funcName);
    Validate::RequirePositive(tolerance, "tolerancePercent", funcName);
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Project::Project(const std::string& name, BoardImage image) {
    Validate::RequireNonEmpty(name, "name", "Project");

    data_.info.name = name;
    data_.image = std::move(image);
    data_.createdAt = Now();
    data_.modifiedAt = data_.createdAt;
}

Project::Project(ProjectData data) {
    Validate::RequireNonEmpty(data.info.name, "name", "Project");
    RequireTolerance(data.tolerancePercent, "Project");

    if (data.points.size() > MAX_POINTS) {
        throw ValidationException("Project: " + std::to_string(data.points.size()) +
                                  " points exceed the limit of " +
                                  std::to_string(MAX_POINTS));
    }
    if (!data.points.empty() && data.image.Empty()) {
        throw ValidationException("Project: points present but no image");
    }

    if (data.nextPointId > MAX_POINT_ID) {
        throw ValidationException("Project: next point id " +
                                  std::to_string(data.nextPointId) + " exceeds " +
                                  std::to_string(MAX_POINT_ID));
    }

    std::unordered_set<int32_t> ids;
    int32_t maxId = 0;
    for (const auto& point : data.points) {
        Validate::RequirePositive(point.id, "point id", "Project");
        if (point.id > MAX_POINT_ID) {
            throw ValidationException("Project: point id " + std::to_string(point.id) +
                                      " exceeds " + std::to_string(MAX_POINT_ID));
        }
        if (!ids.insert(point.id).second) {
            throw ValidationException("Project: duplicate point id " +
                                      std::to_string(point.id));
        }
        ValidatePoint(point, data.image.Width(), data.image.Height());
        maxId = std::max(maxId, point.id);
    }

    data.nextPointId = std::max(data.nextPointId, maxId + 1);
    data_ = std::move(data);
}

Project::Project(const Project& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    data_ = other.data_;
    revision_ = other.revision_;
}

Project::Project(Project&& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    data_ = std::move(other.data_);
    revision_ = other.revision_;
}

Project& Project::operator=(const Project& other) {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        data_ = other.data_;
        ++revision_;
    }
    return *this;
}

Project& Project::operator=(Project&& other) {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        data_ = std::move(other.data_);
        ++revision_;
    }
    return *this;
}

// =============================================================================
// Metadata
// =============================================================================

ProjectInfo Project::Info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.info;
}

std::string Project::Name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.info.name;
}

void Project::SetInfo(const ProjectInfo& info) {
    Validate::RequireNonEmpty(info.name, "name", "SetInfo");

    std::lock_guard<std::mutex> lock(mutex_);
    data_.info = info;
    TouchLocked(Now());
}

double Project::TolerancePercent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.tolerancePercent;
}

void Project::SetTolerancePercent(double tolerance) {
    RequireTolerance(tolerance, "SetTolerancePercent");

    std::lock_guard<std::mutex> lock(mutex_);
    data_.tolerancePercent = tolerance;
    TouchLocked(Now());
}

Timestamp Project::CreatedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.createdAt;
}

Timestamp Project::ModifiedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.modifiedAt;
}

uint64_t Project::Revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

// =============================================================================
// Image
// =============================================================================

bool Project::HasImage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !data_.image.Empty();
}

int32_t Project::ImageWidth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.image.Width();
}

int32_t Project::ImageHeight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.image.Height();
}

BoardImage Project::Image() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.image;
}

void Project::SetImage(BoardImage image) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& point : data_.points) {
        if (!image.Contains(point.x, point.y)) {
            throw ValidationException("SetImage: point #" + std::to_string(point.id) +
                                      " would fall outside the new image");
        }
    }
    data_.image = std::move(image);
    TouchLocked(Now());
}

// =============================================================================
// Points
// =============================================================================

size_t Project::PointCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.points.size();
}

bool Project::HasPoint(int32_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindLocked(id) != nullptr;
}

std::vector<Point> Project::Points() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.points;
}

std::vector<int32_t> Project::PointIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int32_t> ids;
    ids.reserve(data_.points.size());
    for (const auto& point : data_.points) {
        ids.push_back(point.id);
    }
    return ids;
}

std::optional<Point> Project::FindPoint(int32_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Point* point = FindLocked(id);
    if (!point) {
        return std::nullopt;
    }
    return *point;
}

Point Project::GetPoint(int32_t id) const {
    std::optional<Point> point = FindPoint(id);
    if (!point) {
        throw ValidationException("point #" + std::to_string(id) + " does not exist");
    }
    return *point;
}

int32_t Project::AddPoint(Point point) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (data_.image.Empty()) {
        throw ValidationException("AddPoint: project has no image");
    }
    if (data_.points.size() >= MAX_POINTS) {
        throw ValidationException("AddPoint: limit of " + std::to_string(MAX_POINTS) +
                                  " points reached");
    }
    if (data_.nextPointId > MAX_POINT_ID) {
        throw ValidationException("AddPoint: point ids exhausted");
    }

    Timestamp ts = Now();
    point.id = data_.nextPointId;
    point.createdAt = ts;
    point.updatedAt = ts;
    ValidatePoint(point, data_.image.Width(), data_.image.Height());

    data_.points.push_back(std::move(point));
    ++data_.nextPointId;
    TouchLocked(ts);
    return data_.points.back().id;
}

void Project::RemovePoint(int32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(data_.points.begin(), data_.points.end(),
                           [id](const Point& p) { return p.id == id; });
    if (it == data_.points.end()) {
        throw ValidationException("RemovePoint: point #" + std::to_string(id) +
                                  " does not exist");
    }
    data_.points.erase(it);
    TouchLocked(Now());
}

void Project::ClearPoints() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (data_.points.empty()) {
        return;
    }
    data_.points.clear();
    TouchLocked(Now());
}

void Project::SetPointGeometry(int32_t id, const Point& geometry) {
    std::lock_guard<std::mutex> lock(mutex_);
    Point* point = FindLocked(id);
    if (!point) {
        throw ValidationException("SetPointGeometry: point #" + std::to_string(id) +
                                  " does not exist");
    }

    Point updated = *point;
    updated.x = geometry.x;
    updated.y = geometry.y;
    updated.shape = geometry.shape;
    updated.radius = geometry.radius;
    updated.width = geometry.width;
    updated.height = geometry.height;
    ValidatePoint(updated, data_.image.Width(), data_.image.Height());

    Timestamp ts = Now();
    updated.updatedAt = ts;
    *point = std::move(updated);
    TouchLocked(ts);
}

void Project::SetPointInfo(int32_t id, const Point& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    Point* point = FindLocked(id);
    if (!point) {
        throw ValidationException("SetPointInfo: point #" + std::to_string(id) +
                                  " does not exist");
    }

    Timestamp ts = Now();
    point->name = info.name;
    point->description = info.description;
    point->componentType = info.componentType;
    point->expectedValue = info.expectedValue;
    point->updatedAt = ts;
    TouchLocked(ts);
}

void Project::SetMeasurement(int32_t id, MeasurementRole role, double value,
                             const std::string& unit, Timestamp timestamp) {
    Validate::RequireFinite(value, "value", "SetMeasurement");

    std::lock_guard<std::mutex> lock(mutex_);
    Point* point = FindLocked(id);
    if (!point) {
        throw ValidationException("SetMeasurement: point #" + std::to_string(id) +
                                  " does not exist");
    }

    if (role == MeasurementRole::Reference) {
        point->referenceValue = value;
        point->referenceUnit = unit;
    } else {
        point->compareValue = value;
        point->compareUnit = unit;
    }
    point->measuredAt = timestamp;
    point->updatedAt = timestamp;
    TouchLocked(timestamp);
}

void Project::ClearMeasurements(int32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Point* point = FindLocked(id);
    if (!point) {
        throw ValidationException("ClearMeasurements: point #" + std::to_string(id) +
                                  " does not exist");
    }

    Timestamp ts = Now();
    point->referenceValue.reset();
    point->compareValue.reset();
    point->referenceUnit.clear();
    point->compareUnit.clear();
    point->measuredAt.reset();
    point->updatedAt = ts;
    TouchLocked(ts);
}

std::optional<Point> Project::FindPointAt(int32_t x, int32_t y, int32_t tolerance) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const Point* closest = nullptr;
    double minDistance = std::numeric_limits<double>::infinity();

    for (const auto& point : data_.points) {
        if (point.Contains(x, y)) {
            return point;
        }

        double dx = static_cast<double>(point.x) - x;
        double dy = static_cast<double>(point.y) - y;
        double distance = std::sqrt(dx * dx + dy * dy);
        if (distance < minDistance && distance <= tolerance) {
            minDistance = distance;
            closest = &point;
        }
    }

    if (!closest) {
        return std::nullopt;
    }
    return *closest;
}

std::vector<Point> Project::PointsInArea(int32_t x1, int32_t y1,
                                         int32_t x2, int32_t y2) const {
    int32_t minX = std::min(x1, x2), maxX = std::max(x1, x2);
    int32_t minY = std::min(y1, y2), maxY = std::max(y1, y2);

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Point> result;
    for (const auto& point : data_.points) {
        if (point.x >= minX && point.x <= maxX && point.y >= minY && point.y <= maxY) {
            result.push_back(point);
        }
    }
    return result;
}

// =============================================================================
// Snapshot
// =============================================================================

ProjectData Project::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

// =============================================================================
// Internal
// =============================================================================

Point* Project::FindLocked(int32_t id) {
    for (auto& point : data_.points) {
        if (point.id == id) {
            return &point;
        }
    }
    return nullptr;
}

const Point* Project::FindLocked(int32_t id) const {
    for (const auto& point : data_.points) {
        if (point.id == id) {
            return &point;
        }
    }
    return nullptr;
}

void Project::TouchLocked(Timestamp ts) {
    data_.modifiedAt = ts;
    ++revision_;
}

} // namespace Mi::Probe
