/**
 * @file test_project_codec.cpp
 * @brief Unit tests for Persistence/ProjectCodec.h
 */

#include <MiProbe/Core/Exception.h>
#include <MiProbe/Persistence/ProjectCodec.h>
#include <MiProbe/Platform/FileIO.h>
#include <gtest/gtest.h>

#include "TestSupport.h"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace Mi::Probe;
using namespace Mi::Probe::Persistence;

namespace {

using Entry = std::pair<std::string, std::vector<uint8_t>>;

// Split a container into its entries (no validation)
std::vector<Entry> ExtractEntries(const std::vector<uint8_t>& buffer) {
    Platform::ByteReader reader(buffer);
    char magic[4];
    reader.ReadBytes(magic, sizeof(magic));
    reader.Read<uint32_t>();
    uint32_t count = reader.Read<uint32_t>();

    std::vector<Entry> entries;
    for (uint32_t i = 0; i < count; ++i) {
        std::string name = reader.ReadString();
        uint64_t size = reader.Read<uint64_t>();
        entries.emplace_back(name, reader.ReadBlock(static_cast<size_t>(size)));
    }
    return entries;
}

std::vector<uint8_t> BuildContainer(const std::vector<Entry>& entries,
                                    uint32_t version = CONTAINER_VERSION) {
    Platform::ByteWriter writer;
    writer.WriteBytes(CONTAINER_MAGIC, sizeof(CONTAINER_MAGIC));
    writer.Write<uint32_t>(version);
    writer.Write<uint32_t>(static_cast<uint32_t>(entries.size()));
    for (const auto& entry : entries) {
        writer.WriteString(entry.first);
        writer.Write<uint64_t>(entry.second.size());
        writer.WriteBytes(entry.second.data(), entry.second.size());
    }
    return writer.Release();
}

std::vector<uint8_t>& EntryBytes(std::vector<Entry>& entries, const std::string& name) {
    for (auto& entry : entries) {
        if (entry.first == name) {
            return entry.second;
        }
    }
    throw std::runtime_error("no entry " + name);
}

} // namespace

class ProjectCodecTest : public ::testing::Test {
protected:
    ProjectCodecTest() : project_("Board A", Mi::Probe::Test::MakeTestImage(64, 48)) {}

    void SetUp() override {
        ProjectInfo info = project_.Info();
        info.boardModel = "PSU-200 rev C";
        info.description = "Golden sample";
        info.isFullyFunctional = false;
        project_.SetInfo(info);
        project_.SetTolerancePercent(7.5);

        int32_t a = project_.AddPoint(Point::MakeCircle(10, 12, 4));
        int32_t b = project_.AddPoint(Point::MakeRectangle(40, 30, 8, 6));
        project_.AddPoint(Point::MakeCircle(60, 40, 3));

        Point info1;
        info1.name = "R12";
        info1.componentType = "resistor";
        info1.expectedValue = "10k";
        info1.description = "Pull-up";
        project_.SetPointInfo(a, info1);

        project_.SetMeasurement(a, MeasurementRole::Reference, 10.0, "V",
                                FromEpochMs(1760000000123));
        project_.SetMeasurement(a, MeasurementRole::Test, 10.4, "V",
                                FromEpochMs(1760000000456));
        project_.SetMeasurement(b, MeasurementRole::Reference, -0.25, "A",
                                FromEpochMs(1760000000789));

        path_ = Mi::Probe::Test::TempPath("codec_test.mip");
        Mi::Probe::Test::RemoveFile(path_);
    }

    void TearDown() override {
        Mi::Probe::Test::RemoveFile(path_);
    }

    Project project_;
    std::string path_;
};

// ============================================================================
// Round Trip
// ============================================================================

TEST_F(ProjectCodecTest, FileRoundTripPreservesEverything) {
    SaveProject(project_, path_);
    ASSERT_TRUE(Mi::Probe::Test::FileExists(path_));
    EXPECT_FALSE(Mi::Probe::Test::FileExists(path_ + ".tmp"));

    Project loaded = LoadProject(path_);
    ProjectData before = project_.Snapshot();
    ProjectData after = loaded.Snapshot();

    EXPECT_EQ(after.info, before.info);
    EXPECT_DOUBLE_EQ(after.tolerancePercent, 7.5);
    EXPECT_EQ(after.createdAt, before.createdAt);
    EXPECT_EQ(after.modifiedAt, before.modifiedAt);
    EXPECT_EQ(after.nextPointId, before.nextPointId);
    EXPECT_EQ(after.image, before.image);

    ASSERT_EQ(after.points.size(), before.points.size());
    for (size_t i = 0; i < before.points.size(); ++i) {
        EXPECT_EQ(after.points[i], before.points[i]) << "point index " << i;
    }
}

TEST_F(ProjectCodecTest, ReadingsAndTimestampsExact) {
    Project loaded = LoadFromBuffer(SaveToBuffer(project_));
    Point a = loaded.GetPoint(1);
    EXPECT_EQ(a.referenceValue, 10.0);
    EXPECT_EQ(a.compareValue, 10.4);
    ASSERT_TRUE(a.measuredAt.has_value());
    EXPECT_EQ(ToEpochMs(*a.measuredAt), 1760000000456);

    Point c = loaded.GetPoint(3);
    EXPECT_FALSE(c.HasReference());
    EXPECT_FALSE(c.measuredAt.has_value());
    EXPECT_EQ(c.radius, 3);
    EXPECT_FALSE(c.width.has_value());
}

TEST_F(ProjectCodecTest, UnitsStoredPerRole) {
    project_.SetMeasurement(3, MeasurementRole::Reference, 5.0, "V",
                            FromEpochMs(1760000001000));
    project_.SetMeasurement(3, MeasurementRole::Test, 5000.0, "mV",
                            FromEpochMs(1760000002000));

    Project loaded = LoadFromBuffer(SaveToBuffer(project_));
    Point c = loaded.GetPoint(3);
    EXPECT_EQ(c.referenceUnit, "V");
    EXPECT_EQ(c.compareUnit, "mV");

    Point b = loaded.GetPoint(2);
    EXPECT_EQ(b.referenceUnit, "A");
    EXPECT_EQ(b.compareUnit, "");
}

TEST_F(ProjectCodecTest, HeaderIsLittleEndian) {
    std::vector<uint8_t> buffer = SaveToBuffer(project_);
    ASSERT_GT(buffer.size(), 25u);

    const std::vector<uint8_t> header = {
        'M', 'I', 'P', 'C',
        0x01, 0x00, 0x00, 0x00,                         // container version
        0x03, 0x00, 0x00, 0x00,                         // entry count
        0x05, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, // name length
        'i', 'm', 'a', 'g', 'e'
    };
    EXPECT_EQ(std::vector<uint8_t>(buffer.begin(), buffer.begin() + 25), header);

    std::vector<Entry> entries = ExtractEntries(buffer);
    const std::vector<uint8_t>& project = EntryBytes(entries, ENTRY_PROJECT);
    ASSERT_GE(project.size(), 4u);
    EXPECT_EQ(project[0], static_cast<uint8_t>(SCHEMA_VERSION));
    EXPECT_EQ(project[1], 0);
    EXPECT_EQ(project[2], 0);
    EXPECT_EQ(project[3], 0);
}

TEST_F(ProjectCodecTest, IdsContinueAfterLoad) {
    project_.RemovePoint(3);
    Project loaded = LoadFromBuffer(SaveToBuffer(project_));
    EXPECT_EQ(loaded.AddPoint(Point::MakeCircle(5, 5)), 4);
}

TEST_F(ProjectCodecTest, ProjectWithoutImage) {
    Project bare("Bare");
    Project loaded = LoadFromBuffer(SaveToBuffer(bare));
    EXPECT_EQ(loaded.Name(), "Bare");
    EXPECT_FALSE(loaded.HasImage());
    EXPECT_EQ(loaded.PointCount(), 0u);
}

TEST_F(ProjectCodecTest, WithoutManifest) {
    std::vector<uint8_t> buffer = SaveToBuffer(project_, SaveOptions().SetWriteManifest(false));
    EXPECT_EQ(ExtractEntries(buffer).size(), 2u);
    EXPECT_EQ(LoadFromBuffer(buffer).PointCount(), 3u);
}

TEST_F(ProjectCodecTest, EntryOrder) {
    std::vector<Entry> entries = ExtractEntries(SaveToBuffer(project_));
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].first, ENTRY_IMAGE);
    EXPECT_EQ(entries[1].first, ENTRY_PROJECT);
    EXPECT_EQ(entries[2].first, ENTRY_MANIFEST);
}

// ============================================================================
// Inspection
// ============================================================================

TEST_F(ProjectCodecTest, ReadProjectInfo) {
    SaveProject(project_, path_);
    ProjectFileInfo info = ReadProjectInfo(path_);
    EXPECT_EQ(info.name, "Board A");
    EXPECT_EQ(info.boardModel, "PSU-200 rev C");
    EXPECT_EQ(info.pointCount, 3u);
    EXPECT_TRUE(info.hasImage);
    EXPECT_EQ(info.fileSize, Mi::Probe::Test::FileSize(path_));
    EXPECT_EQ(info.schemaVersion, SCHEMA_VERSION);
}

TEST_F(ProjectCodecTest, IsProjectFile) {
    EXPECT_FALSE(IsProjectFile(path_));
    SaveProject(project_, path_);
    EXPECT_TRUE(IsProjectFile(path_));

    ASSERT_TRUE(Platform::WriteTextFile(path_, "MIP"));
    EXPECT_FALSE(IsProjectFile(path_));
}

// ============================================================================
// Text Export
// ============================================================================

TEST_F(ProjectCodecTest, FormatProjectTextShowsContent) {
    std::string text = FormatProjectText(SaveToBuffer(project_));

    EXPECT_EQ(text.front(), '{');
    EXPECT_NE(text.find("\"schemaVersion\": " + std::to_string(SCHEMA_VERSION)),
              std::string::npos);
    EXPECT_NE(text.find("\"name\": \"Board A\""), std::string::npos);
    EXPECT_NE(text.find("\"boardModel\": \"PSU-200 rev C\""), std::string::npos);
    EXPECT_NE(text.find("\"isFullyFunctional\": false"), std::string::npos);
    EXPECT_NE(text.find("\"tolerancePercent\": 7.5"), std::string::npos);
    EXPECT_NE(text.find("{ \"name\": \"manifest\", \"size\": "), std::string::npos);
    EXPECT_NE(text.find("\"format\": \"png\""), std::string::npos);

    EXPECT_NE(text.find("\"name\": \"R12\""), std::string::npos);
    EXPECT_NE(text.find("\"compareValue\": 10.4"), std::string::npos);
    EXPECT_NE(text.find("\"referenceValue\": -0.25"), std::string::npos);
    EXPECT_NE(text.find("\"referenceUnit\": \"A\""), std::string::npos);
    EXPECT_NE(text.find("\"epochMs\": 1760000000456"), std::string::npos);
    EXPECT_NE(text.find("\"measuredAt\": null"), std::string::npos);
    EXPECT_NE(text.find("\"shape\": \"" + std::string(ShapeName(PointShape::Rectangle))),
              std::string::npos);

    size_t points = 0;
    for (size_t pos = text.find("\"id\": "); pos != std::string::npos;
         pos = text.find("\"id\": ", pos + 1)) {
        ++points;
    }
    EXPECT_EQ(points, 3u);
}

TEST_F(ProjectCodecTest, FormatProjectTextEscapesStrings) {
    ProjectInfo info = project_.Info();
    info.description = "line1\n\"quoted\"\t\\";
    project_.SetInfo(info);

    std::string text = FormatProjectText(SaveToBuffer(project_));
    EXPECT_NE(text.find("\"description\": \"line1\\n\\\"quoted\\\"\\t\\\\\""),
              std::string::npos);
}

TEST_F(ProjectCodecTest, FormatProjectTextWithoutImage) {
    std::string text = FormatProjectText(SaveToBuffer(Project("Bare")));
    EXPECT_NE(text.find("\"image\": null"), std::string::npos);
    EXPECT_NE(text.find("\"points\": []"), std::string::npos);
}

TEST_F(ProjectCodecTest, FormatProjectTextRejectsBadInput) {
    EXPECT_THROW(FormatProjectText({'n', 'o', 'p', 'e'}), FormatException);

    std::vector<uint8_t> buffer = SaveToBuffer(project_);
    buffer.resize(buffer.size() - 10);
    EXPECT_THROW(FormatProjectText(buffer), CorruptContainerException);
}

TEST_F(ProjectCodecTest, ExportTextWritesFile) {
    SaveProject(project_, path_);
    const std::string textPath = Mi::Probe::Test::TempPath("codec_export.json");
    ExportText(path_, textPath);

    std::vector<uint8_t> buffer;
    ASSERT_TRUE(Platform::ReadBinaryFile(path_, buffer));
    std::vector<uint8_t> exported;
    ASSERT_TRUE(Platform::ReadBinaryFile(textPath, exported));
    std::string expected = FormatProjectText(buffer);
    EXPECT_EQ(std::string(exported.begin(), exported.end()), expected);

    Mi::Probe::Test::RemoveFile(textPath);
}

TEST_F(ProjectCodecTest, ExportTextErrors) {
    EXPECT_THROW(ExportText(Mi::Probe::Test::TempPath("does_not_exist.mip"),
                            Mi::Probe::Test::TempPath("never_written.json")),
                 IOException);
    EXPECT_FALSE(Mi::Probe::Test::FileExists(Mi::Probe::Test::TempPath("never_written.json")));

    SaveProject(project_, path_);
    EXPECT_THROW(ExportText(path_, "/nonexistent_miprobe_dir/board.json"), IOException);

    ASSERT_TRUE(Platform::WriteTextFile(path_, "not a project"));
    EXPECT_THROW(ExportText(path_, Mi::Probe::Test::TempPath("never_written.json")), FormatException);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ProjectCodecTest, MissingFileIsIOError) {
    EXPECT_THROW(LoadProject(Mi::Probe::Test::TempPath("does_not_exist.mip")), IOException);
}

TEST_F(ProjectCodecTest, UnwritablePathIsIOError) {
    EXPECT_THROW(SaveProject(project_, "/nonexistent_miprobe_dir/board.mip"), IOException);
}

TEST_F(ProjectCodecTest, FailedSaveKeepsExistingFile) {
    SaveProject(project_, path_);
    std::vector<uint8_t> original;
    ASSERT_TRUE(Platform::ReadBinaryFile(path_, original));

    // Block the temp file path with a directory so the write fails
    ASSERT_TRUE(Mi::Probe::Test::MakeDirectory(path_ + ".tmp"));
    project_.SetTolerancePercent(1.0);
    EXPECT_THROW(SaveProject(project_, path_), IOException);

    std::vector<uint8_t> current;
    ASSERT_TRUE(Platform::ReadBinaryFile(path_, current));
    EXPECT_EQ(current, original);
    std::remove((path_ + ".tmp").c_str());
}

TEST_F(ProjectCodecTest, BadMagicIsFormatError) {
    std::vector<uint8_t> buffer = SaveToBuffer(project_);
    buffer[0] = 'X';
    EXPECT_THROW(LoadFromBuffer(buffer), FormatException);
    EXPECT_THROW(LoadFromBuffer({}), FormatException);
}

TEST_F(ProjectCodecTest, UnsupportedContainerVersion) {
    std::vector<uint8_t> buffer = BuildContainer(ExtractEntries(SaveToBuffer(project_)), 2);
    EXPECT_THROW(LoadFromBuffer(buffer), FormatException);
}

TEST_F(ProjectCodecTest, UnsupportedSchemaVersion) {
    std::vector<Entry> entries =
        ExtractEntries(SaveToBuffer(project_, SaveOptions().SetWriteManifest(false)));
    std::vector<uint8_t>& bytes = EntryBytes(entries, ENTRY_PROJECT);
    bytes[0] = static_cast<uint8_t>(SCHEMA_VERSION + 1);
    EXPECT_THROW(LoadFromBuffer(BuildContainer(entries)), FormatException);

    bytes[0] = 0;
    EXPECT_THROW(LoadFromBuffer(BuildContainer(entries)), FormatException);
}

TEST_F(ProjectCodecTest, LoadsSchemaOneWithSingleUnit) {
    Platform::ByteWriter writer;
    writer.Write<uint32_t>(1);
    writer.WriteString("Legacy");
    writer.WriteString("");
    writer.WriteString("");
    writer.Write<uint8_t>(1);
    writer.Write<double>(5.0);
    writer.Write<int64_t>(1760000000000);
    writer.Write<int64_t>(1760000000000);
    writer.Write<int32_t>(2);
    writer.Write<uint32_t>(1);

    // Circle with radius and reference reading, measured
    writer.Write<int32_t>(1);
    writer.Write<int32_t>(10);
    writer.Write<int32_t>(12);
    writer.Write<uint8_t>(0);
    writer.Write<uint8_t>(1 | 8 | 32);
    writer.Write<int32_t>(4);
    writer.Write<int32_t>(0);
    writer.Write<int32_t>(0);
    writer.Write<double>(3.3);
    writer.Write<double>(0.0);
    writer.WriteString("V");
    for (int i = 0; i < 4; ++i) {
        writer.WriteString("");
    }
    writer.Write<int64_t>(1760000000000);
    writer.Write<int64_t>(1760000000000);
    writer.Write<int64_t>(1760000000500);

    std::vector<Entry> entries =
        ExtractEntries(SaveToBuffer(project_, SaveOptions().SetWriteManifest(false)));
    EntryBytes(entries, ENTRY_PROJECT) = writer.Release();

    Project loaded = LoadFromBuffer(BuildContainer(entries));
    Point p = loaded.GetPoint(1);
    EXPECT_EQ(p.referenceValue, 3.3);
    EXPECT_EQ(p.referenceUnit, "V");
    EXPECT_FALSE(p.HasCompare());
    EXPECT_EQ(p.compareUnit, "");
    EXPECT_EQ(loaded.AddPoint(Point::MakeCircle(30, 30)), 2);
}

TEST_F(ProjectCodecTest, MissingSchemaVersion) {
    std::vector<Entry> entries =
        ExtractEntries(SaveToBuffer(project_, SaveOptions().SetWriteManifest(false)));
    EntryBytes(entries, ENTRY_PROJECT).clear();
    EXPECT_THROW(LoadFromBuffer(BuildContainer(entries)), FormatException);
}

TEST_F(ProjectCodecTest, MissingProjectEntry) {
    std::vector<Entry> entries =
        ExtractEntries(SaveToBuffer(project_, SaveOptions().SetWriteManifest(false)));
    entries.pop_back();
    EXPECT_THROW(LoadFromBuffer(BuildContainer(entries)), FormatException);
}

TEST_F(ProjectCodecTest, TruncatedIsCorrupt) {
    std::vector<uint8_t> buffer = SaveToBuffer(project_);
    buffer.resize(buffer.size() - 10);
    EXPECT_THROW(LoadFromBuffer(buffer), CorruptContainerException);

    buffer.resize(8);
    EXPECT_THROW(LoadFromBuffer(buffer), CorruptContainerException);
}

TEST_F(ProjectCodecTest, FlippedByteFailsManifest) {
    std::vector<Entry> entries = ExtractEntries(SaveToBuffer(project_));
    std::vector<uint8_t>& bytes = EntryBytes(entries, ENTRY_PROJECT);
    bytes[bytes.size() / 2] ^= 0x40;

    EXPECT_THROW(LoadFromBuffer(BuildContainer(entries)), CorruptContainerException);
}

TEST_F(ProjectCodecTest, TruncatedProjectEntryIsCorrupt) {
    std::vector<Entry> entries =
        ExtractEntries(SaveToBuffer(project_, SaveOptions().SetWriteManifest(false)));
    std::vector<uint8_t>& bytes = EntryBytes(entries, ENTRY_PROJECT);
    bytes.resize(bytes.size() - 5);

    EXPECT_THROW(LoadFromBuffer(BuildContainer(entries)), CorruptContainerException);
}

TEST_F(ProjectCodecTest, UndecodableImageIsCorrupt) {
    std::vector<Entry> entries =
        ExtractEntries(SaveToBuffer(project_, SaveOptions().SetWriteManifest(false)));
    EntryBytes(entries, ENTRY_IMAGE) = {'j', 'u', 'n', 'k'};

    EXPECT_THROW(LoadFromBuffer(BuildContainer(entries)), CorruptContainerException);
}

TEST_F(ProjectCodecTest, PointsOutsideImageAreCorrupt) {
    std::vector<Entry> entries =
        ExtractEntries(SaveToBuffer(project_, SaveOptions().SetWriteManifest(false)));
    // Project has points, image entry emptied
    EntryBytes(entries, ENTRY_IMAGE).clear();

    EXPECT_THROW(LoadFromBuffer(BuildContainer(entries)), CorruptContainerException);
}

TEST_F(ProjectCodecTest, UnknownEntryIgnoredWithWarning) {
    Mi::Probe::Test::LogCapture capture;
    std::vector<Entry> entries = ExtractEntries(SaveToBuffer(project_));
    entries.emplace_back("thumbnail", std::vector<uint8_t>{1, 2, 3});

    Project loaded = LoadFromBuffer(BuildContainer(entries));
    EXPECT_EQ(loaded.PointCount(), 3u);
    EXPECT_TRUE(capture.Contains(Platform::LogLevel::Warning, "thumbnail"));
}

TEST_F(ProjectCodecTest, DuplicateEntryIsCorrupt) {
    std::vector<Entry> entries =
        ExtractEntries(SaveToBuffer(project_, SaveOptions().SetWriteManifest(false)));
    entries.push_back(entries.front());
    EXPECT_THROW(LoadFromBuffer(BuildContainer(entries)), CorruptContainerException);
}
