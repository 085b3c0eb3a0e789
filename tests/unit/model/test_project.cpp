/**
 * @file test_project.cpp
 * @brief Unit tests for Model/Project.h
 */

#include <MiProbe/Core/Exception.h>
#include <MiProbe/Model/Project.h>
#include <gtest/gtest.h>

#include "TestSupport.h"

#include <cstdint>
#include <limits>

using namespace Mi::Probe;

class ProjectTest : public ::testing::Test {
protected:
    ProjectTest() : project_("Board A", Mi::Probe::Test::MakeTestImage(640, 480)) {}

    Project project_;
};

// ============================================================================
// Metadata
// ============================================================================

TEST_F(ProjectTest, Defaults) {
    EXPECT_EQ(project_.Name(), "Board A");
    EXPECT_EQ(project_.Info().boardModel, "Unknown model");
    EXPECT_TRUE(project_.Info().isFullyFunctional);
    EXPECT_DOUBLE_EQ(project_.TolerancePercent(), DEFAULT_TOLERANCE_PERCENT);
    EXPECT_EQ(project_.PointCount(), 0u);
    EXPECT_TRUE(project_.HasImage());
    EXPECT_EQ(project_.ImageWidth(), 640);
}

TEST_F(ProjectTest, EmptyNameRejected) {
    EXPECT_THROW({ Project unnamed(""); }, ValidationException);

    ProjectInfo info;
    EXPECT_THROW(project_.SetInfo(info), ValidationException);
    EXPECT_EQ(project_.Name(), "Board A");
}

TEST_F(ProjectTest, ToleranceMustBePositiveAndFinite) {
    project_.SetTolerancePercent(2.5);
    EXPECT_DOUBLE_EQ(project_.TolerancePercent(), 2.5);

    EXPECT_THROW(project_.SetTolerancePercent(0.0), ValidationException);
    EXPECT_THROW(project_.SetTolerancePercent(-1.0), ValidationException);
    EXPECT_THROW(project_.SetTolerancePercent(std::numeric_limits<double>::infinity()),
                 ValidationException);
    EXPECT_DOUBLE_EQ(project_.TolerancePercent(), 2.5);
}

TEST_F(ProjectTest, MutationsBumpRevision) {
    uint64_t r0 = project_.Revision();
    project_.SetTolerancePercent(3.0);
    uint64_t r1 = project_.Revision();
    EXPECT_GT(r1, r0);

    EXPECT_THROW(project_.SetTolerancePercent(-3.0), ValidationException);
    EXPECT_EQ(project_.Revision(), r1);
}

// ============================================================================
// Points
// ============================================================================

TEST_F(ProjectTest, AddAssignsIncreasingIds) {
    int32_t a = project_.AddPoint(Point::MakeCircle(10, 10));
    int32_t b = project_.AddPoint(Point::MakeRectangle(20, 20, 8, 4));
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 2);
    EXPECT_EQ(project_.PointIds(), (std::vector<int32_t>{1, 2}));

    project_.RemovePoint(b);
    EXPECT_EQ(project_.AddPoint(Point::MakeCircle(30, 30)), 3);
}

TEST_F(ProjectTest, IdsNotReusedAfterClear) {
    project_.AddPoint(Point::MakeCircle(10, 10));
    project_.ClearPoints();
    EXPECT_EQ(project_.PointCount(), 0u);
    EXPECT_EQ(project_.AddPoint(Point::MakeCircle(10, 10)), 2);
}

TEST_F(ProjectTest, AddRejectsInvalidGeometry) {
    EXPECT_THROW(project_.AddPoint(Point::MakeCircle(10, 10, 0)), ValidationException);
    EXPECT_THROW(project_.AddPoint(Point::MakeCircle(640, 10)), ValidationException);
    EXPECT_THROW(project_.AddPoint(Point::MakeRectangle(10, 10, -1, 5)), ValidationException);
    EXPECT_EQ(project_.PointCount(), 0u);
}

TEST_F(ProjectTest, AddRequiresImage) {
    Project bare("No image");
    EXPECT_FALSE(bare.HasImage());
    EXPECT_THROW(bare.AddPoint(Point::MakeCircle(0, 0)), ValidationException);
}

TEST_F(ProjectTest, UnknownIdRejected) {
    EXPECT_FALSE(project_.HasPoint(42));
    EXPECT_FALSE(project_.FindPoint(42).has_value());
    EXPECT_THROW(project_.GetPoint(42), ValidationException);
    EXPECT_THROW(project_.RemovePoint(42), ValidationException);
    EXPECT_THROW(project_.SetMeasurement(42, MeasurementRole::Test, 1.0, "V", Now()),
                 ValidationException);
}

TEST_F(ProjectTest, GeometryChangeIsAtomic) {
    int32_t id = project_.AddPoint(Point::MakeCircle(10, 10, 5));

    Point bad = Point::MakeRectangle(15, 15, 10, 10);
    bad.height.reset();
    EXPECT_THROW(project_.SetPointGeometry(id, bad), ValidationException);

    Point stored = project_.GetPoint(id);
    EXPECT_EQ(stored.shape, PointShape::Circle);
    EXPECT_EQ(stored.x, 10);
    EXPECT_EQ(stored.radius, 5);

    project_.SetPointGeometry(id, Point::MakeRectangle(15, 16, 10, 6));
    stored = project_.GetPoint(id);
    EXPECT_EQ(stored.shape, PointShape::Rectangle);
    EXPECT_EQ(stored.x, 15);
    EXPECT_EQ(stored.y, 16);
    EXPECT_FALSE(stored.radius.has_value());
    EXPECT_EQ(stored.id, id);
}

TEST_F(ProjectTest, SetPointInfoKeepsGeometry) {
    int32_t id = project_.AddPoint(Point::MakeCircle(10, 10));
    Point info;
    info.name = "C4";
    info.componentType = "capacitor";
    info.expectedValue = "100uF";
    info.x = 999;
    project_.SetPointInfo(id, info);

    Point stored = project_.GetPoint(id);
    EXPECT_EQ(stored.name, "C4");
    EXPECT_EQ(stored.componentType, "capacitor");
    EXPECT_EQ(stored.x, 10);
}

TEST_F(ProjectTest, SetMeasurementWritesRoleField) {
    int32_t id = project_.AddPoint(Point::MakeCircle(10, 10));
    Timestamp ts = FromEpochMs(1760000000123);

    project_.SetMeasurement(id, MeasurementRole::Reference, 10.0, "V", ts);
    Point p = project_.GetPoint(id);
    EXPECT_EQ(p.referenceValue, 10.0);
    EXPECT_FALSE(p.compareValue.has_value());
    EXPECT_EQ(p.measuredAt, ts);
    EXPECT_EQ(p.referenceUnit, "V");
    EXPECT_EQ(p.compareUnit, "");

    project_.SetMeasurement(id, MeasurementRole::Test, 10400.0, "mV", ts);
    p = project_.GetPoint(id);
    EXPECT_TRUE(p.IsMeasured());
    EXPECT_EQ(p.Unit(MeasurementRole::Reference), "V");
    EXPECT_EQ(p.Unit(MeasurementRole::Test), "mV");

    EXPECT_THROW(project_.SetMeasurement(id, MeasurementRole::Test,
                                         std::numeric_limits<double>::quiet_NaN(), "V", ts),
                 ValidationException);
    EXPECT_EQ(project_.GetPoint(id).compareValue, 10400.0);

    project_.ClearMeasurements(id);
    p = project_.GetPoint(id);
    EXPECT_FALSE(p.HasReference());
    EXPECT_EQ(p.referenceUnit, "");
    EXPECT_EQ(p.compareUnit, "");
}

TEST_F(ProjectTest, SetImageRejectsShrinkBelowPoints) {
    project_.AddPoint(Point::MakeCircle(600, 400));
    EXPECT_THROW(project_.SetImage(Mi::Probe::Test::MakeTestImage(320, 240)), ValidationException);
    EXPECT_EQ(project_.ImageWidth(), 640);
    EXPECT_NO_THROW(project_.SetImage(Mi::Probe::Test::MakeTestImage(800, 600)));
}

// ============================================================================
// Hit Testing
// ============================================================================

TEST_F(ProjectTest, FindPointAtPrefersContainingMarker) {
    int32_t a = project_.AddPoint(Point::MakeCircle(100, 100, 20));
    int32_t b = project_.AddPoint(Point::MakeCircle(135, 100, 5));

    auto hit = project_.FindPointAt(115, 100);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->id, a);

    hit = project_.FindPointAt(145, 100);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->id, b);

    EXPECT_FALSE(project_.FindPointAt(300, 300).has_value());
}

TEST_F(ProjectTest, PointsInArea) {
    project_.AddPoint(Point::MakeCircle(10, 10));
    project_.AddPoint(Point::MakeCircle(50, 50));
    project_.AddPoint(Point::MakeCircle(200, 200));

    EXPECT_EQ(project_.PointsInArea(60, 60, 0, 0).size(), 2u);
}

// ============================================================================
// Restore
// ============================================================================

TEST_F(ProjectTest, RestoreRaisesNextId) {
    project_.AddPoint(Point::MakeCircle(10, 10));
    project_.AddPoint(Point::MakeCircle(20, 20));
    ProjectData data = project_.Snapshot();
    data.nextPointId = 1;

    Project restored(std::move(data));
    EXPECT_EQ(restored.PointCount(), 2u);
    EXPECT_EQ(restored.AddPoint(Point::MakeCircle(30, 30)), 3);
}

TEST_F(ProjectTest, RestoreRejectsDuplicateIds) {
    project_.AddPoint(Point::MakeCircle(10, 10));
    ProjectData data = project_.Snapshot();
    data.points.push_back(data.points.front());
    EXPECT_THROW({ Project restored(std::move(data)); }, ValidationException);
}

TEST_F(ProjectTest, RestoreRejectsIdsAtInt32Limit) {
    project_.AddPoint(Point::MakeCircle(10, 10));

    ProjectData data = project_.Snapshot();
    data.points.front().id = INT32_MAX;
    EXPECT_THROW({ Project restored(std::move(data)); }, ValidationException);

    data = project_.Snapshot();
    data.nextPointId = INT32_MAX;
    EXPECT_THROW({ Project restored(std::move(data)); }, ValidationException);
}

TEST_F(ProjectTest, LastIdCanBeRestoredButNotExceeded) {
    project_.AddPoint(Point::MakeCircle(10, 10));
    ProjectData data = project_.Snapshot();
    data.points.front().id = MAX_POINT_ID;

    Project restored(std::move(data));
    EXPECT_EQ(restored.GetPoint(MAX_POINT_ID).x, 10);
    EXPECT_THROW(restored.AddPoint(Point::MakeCircle(20, 20)), ValidationException);
    EXPECT_EQ(restored.PointCount(), 1u);
}

TEST_F(ProjectTest, RestoreRejectsPointsWithoutImage) {
    project_.AddPoint(Point::MakeCircle(10, 10));
    ProjectData data = project_.Snapshot();
    data.image = BoardImage();
    EXPECT_THROW({ Project restored(std::move(data)); }, ValidationException);
}

TEST_F(ProjectTest, CopyIsIndependent) {
    project_.AddPoint(Point::MakeCircle(10, 10));
    Project copy(project_);
    copy.ClearPoints();
    EXPECT_EQ(project_.PointCount(), 1u);
    EXPECT_EQ(copy.PointCount(), 0u);
}
