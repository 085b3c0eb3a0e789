/**
 * @file test_types.cpp
 * @brief Unit tests for Core/Types.h and Core/Exception.h
 */

#include <MiProbe/Core/Exception.h>
#include <MiProbe/Core/Types.h>
#include <gtest/gtest.h>

#include <string>

using namespace Mi::Probe;

// ============================================================================
// Timestamp Tests
// ============================================================================

TEST(TimestampTest, EpochRoundTrip) {
    Timestamp ts = FromEpochMs(1760000000123);
    EXPECT_EQ(ToEpochMs(ts), 1760000000123);
}

TEST(TimestampTest, NowHasMillisecondResolution) {
    Timestamp before = Now();
    Timestamp after = Now();
    EXPECT_LE(ToEpochMs(before), ToEpochMs(after));
    EXPECT_GT(ToEpochMs(before), 0);
}

TEST(TimestampTest, FormatEpoch) {
    EXPECT_EQ(FormatTimestamp(FromEpochMs(0)), "1970-01-01T00:00:00.000Z");
}

TEST(TimestampTest, FormatKeepsMilliseconds) {
    // 2001-09-09T01:46:40.042Z
    EXPECT_EQ(FormatTimestamp(FromEpochMs(1000000000042)), "2001-09-09T01:46:40.042Z");
}

// ============================================================================
// Enum Name Tests
// ============================================================================

TEST(EnumNameTest, RoleNames) {
    EXPECT_STREQ(RoleName(MeasurementRole::Reference), "reference");
    EXPECT_STREQ(RoleName(MeasurementRole::Test), "test");
}

TEST(EnumNameTest, ShapeNames) {
    EXPECT_STREQ(ShapeName(PointShape::Circle), "circle");
    EXPECT_STREQ(ShapeName(PointShape::Rectangle), "rectangle");
}

// ============================================================================
// Exception Tests
// ============================================================================

TEST(ExceptionTest, MessagePrefixes) {
    EXPECT_STREQ(ValidationException("x").what(), "Validation failed: x");
    EXPECT_STREQ(StateException("x").what(), "Illegal state: x");
    EXPECT_STREQ(FormatException("x").what(), "Format error: x");
    EXPECT_STREQ(CorruptContainerException("x").what(), "Corrupt container: x");
    EXPECT_STREQ(IOException("x").what(), "I/O error: x");
    EXPECT_STREQ(InvalidArgumentException("x").what(), "Invalid argument: x");
}

TEST(ExceptionTest, AllDeriveFromBase) {
    EXPECT_THROW(throw ValidationException("v"), Exception);
    EXPECT_THROW(throw StateException("s"), Exception);
    EXPECT_THROW(throw AcquisitionException(AcquisitionFailure::Timeout, "a"), Exception);
    EXPECT_THROW(throw CorruptContainerException("c"), std::runtime_error);
}

TEST(ExceptionTest, AcquisitionCarriesFailure) {
    AcquisitionException e(AcquisitionFailure::ChecksumMismatch, "point #3");
    EXPECT_EQ(e.Failure(), AcquisitionFailure::ChecksumMismatch);
    EXPECT_STREQ(e.what(), "Acquisition ChecksumMismatch: point #3");
}

TEST(ExceptionTest, AcquisitionFailureNames) {
    EXPECT_STREQ(AcquisitionFailureName(AcquisitionFailure::Timeout), "Timeout");
    EXPECT_STREQ(AcquisitionFailureName(AcquisitionFailure::DeviceNotResponding),
                 "DeviceNotResponding");
    EXPECT_STREQ(AcquisitionFailureName(AcquisitionFailure::Cancelled), "Cancelled");
}
