#include <MiProbe/Model/Point.h>
#include <MiProbe/Core/Exception.h>
#include <MiProbe/Core/Validate.h>

#include <cmath>
#include <cstdlib>

namespace Mi::Probe {

namespace {

constexpr double POINT_PI = 3.14159265358979323846;

std::string PointLabel(const Point& point) {
    return "point #" + std::to_string(point.id);
}

} // anonymous namespace

// =============================================================================
// Factories
// =============================================================================

Point Point::MakeCircle(int32_t x, int32_t y, int32_t radius) {
    Point p;
    p.x = x;
    p.y = y;
    p.shape = PointShape::Circle;
    p.radius = radius;
    p.createdAt = Now();
    p.updatedAt = p.createdAt;
    return p;
}

Point Point::MakeRectangle(int32_t x, int32_t y, int32_t width, int32_t height) {
    Point p;
    p.x = x;
    p.y = y;
    p.shape = PointShape::Rectangle;
    p.width = width;
    p.height = height;
    p.createdAt = Now();
    p.updatedAt = p.createdAt;
    return p;
}

// =============================================================================
// Geometry
// =============================================================================

double Point::Area() const {
    if (shape == PointShape::Circle && radius) {
        return POINT_PI * static_cast<double>(*radius) * static_cast<double>(*radius);
    }
    if (shape == PointShape::Rectangle && width && height) {
        return static_cast<double>(*width) * static_cast<double>(*height);
    }
    return 0.0;
}

bool Point::Contains(int32_t px, int32_t py) const {
    double dx = static_cast<double>(px) - x;
    double dy = static_cast<double>(py) - y;

    if (shape == PointShape::Circle && radius) {
        return std::sqrt(dx * dx + dy * dy) <= *radius;
    }
    if (shape == PointShape::Rectangle && width && height) {
        return std::abs(dx) <= *width / 2.0 && std::abs(dy) <= *height / 2.0;
    }
    return false;
}

// =============================================================================
// Display
// =============================================================================

std::string Point::DisplayName() const {
    if (!name.empty()) {
        return "#" + std::to_string(id) + ": " + name;
    }
    return "Point #" + std::to_string(id);
}

std::string Point::SizeText() const {
    if (shape == PointShape::Circle) {
        return "r=" + (radius ? std::to_string(*radius) : std::string("?")) + "px";
    }
    return (width ? std::to_string(*width) : std::string("?")) + "x" +
           (height ? std::to_string(*height) : std::string("?")) + "px";
}

bool Point::operator==(const Point& other) const {
    return id == other.id && x == other.x && y == other.y && shape == other.shape &&
           radius == other.radius && width == other.width && height == other.height &&
           referenceValue == other.referenceValue && compareValue == other.compareValue &&
           referenceUnit == other.referenceUnit && compareUnit == other.compareUnit &&
           name == other.name && description == other.description &&
           componentType == other.componentType && expectedValue == other.expectedValue &&
           createdAt == other.createdAt && updatedAt == other.updatedAt &&
           measuredAt == other.measuredAt;
}

// =============================================================================
// Validation
// =============================================================================

void ValidateGeometry(const Point& point) {
    const std::string label = PointLabel(point);

    if (point.shape == PointShape::Circle) {
        if (!point.radius) {
            throw ValidationException(label + ": circle requires a radius");
        }
        if (point.width || point.height) {
            throw ValidationException(label + ": circle must not carry width/height");
        }
        Validate::RequirePositive(*point.radius, "radius", label.c_str());
    } else {
        if (!point.width || !point.height) {
            throw ValidationException(label + ": rectangle requires width and height");
        }
        if (point.radius) {
            throw ValidationException(label + ": rectangle must not carry a radius");
        }
        Validate::RequirePositive(*point.width, "width", label.c_str());
        Validate::RequirePositive(*point.height, "height", label.c_str());
    }

    if (point.referenceValue) {
        Validate::RequireFinite(*point.referenceValue, "referenceValue", label.c_str());
    }
    if (point.compareValue) {
        Validate::RequireFinite(*point.compareValue, "compareValue", label.c_str());
    }
}

void ValidatePoint(const Point& point, int32_t imageWidth, int32_t imageHeight) {
    ValidateGeometry(point);

    if (point.x < 0 || point.y < 0 || point.x >= imageWidth || point.y >= imageHeight) {
        throw ValidationException(
            PointLabel(point) + ": position (" + std::to_string(point.x) + ", " +
            std::to_string(point.y) + ") outside image " + std::to_string(imageWidth) +
            "x" + std::to_string(imageHeight));
    }
}

} // namespace Mi::Probe
