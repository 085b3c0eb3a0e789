#include <MiProbe/Persistence/ProjectCodec.h>
#include <MiProbe/Core/Exception.h>
#include <MiProbe/IO/ImageStore.h>
#include <MiProbe/Platform/Checksum.h>
#include <MiProbe/Platform/FileIO.h>
#include <MiProbe/Platform/Log.h>
#include <MiProbe/Platform/Timer.h>

#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <map>
#include <optional>

namespace Mi::Probe::Persistence {

using Platform::ByteReader;
using Platform::ByteWriter;
using Platform::Log;

namespace {

// Sanity limits when decoding
constexpr uint32_t MAX_ENTRIES = 64;
constexpr size_t HEADER_SIZE = sizeof(CONTAINER_MAGIC) + 2 * sizeof(uint32_t);

// Optional-field presence bits of a point record
constexpr uint8_t HAS_RADIUS      = 1 << 0;
constexpr uint8_t HAS_WIDTH       = 1 << 1;
constexpr uint8_t HAS_HEIGHT      = 1 << 2;
constexpr uint8_t HAS_REFERENCE   = 1 << 3;
constexpr uint8_t HAS_COMPARE     = 1 << 4;
constexpr uint8_t HAS_MEASURED_AT = 1 << 5;

using EntryMap = std::map<std::string, std::vector<uint8_t>>;

// =============================================================================
// Project entry
// =============================================================================

void WritePoint(ByteWriter& writer, const Point& point) {
    uint8_t flags = 0;
    if (point.radius) flags |= HAS_RADIUS;
    if (point.width) flags |= HAS_WIDTH;
    if (point.height) flags |= HAS_HEIGHT;
    if (point.referenceValue) flags |= HAS_REFERENCE;
    if (point.compareValue) flags |= HAS_COMPARE;
    if (point.measuredAt) flags |= HAS_MEASURED_AT;

    writer.Write<int32_t>(point.id);
    writer.Write<int32_t>(point.x);
    writer.Write<int32_t>(point.y);
    writer.Write<uint8_t>(static_cast<uint8_t>(point.shape));
    writer.Write<uint8_t>(flags);
    writer.Write<int32_t>(point.radius.value_or(0));
    writer.Write<int32_t>(point.width.value_or(0));
    writer.Write<int32_t>(point.height.value_or(0));
    writer.Write<double>(point.referenceValue.value_or(0.0));
    writer.Write<double>(point.compareValue.value_or(0.0));
    writer.WriteString(point.referenceUnit);
    writer.WriteString(point.compareUnit);
    writer.WriteString(point.name);
    writer.WriteString(point.description);
    writer.WriteString(point.componentType);
    writer.WriteString(point.expectedValue);
    writer.Write<int64_t>(ToEpochMs(point.createdAt));
    writer.Write<int64_t>(ToEpochMs(point.updatedAt));
    writer.Write<int64_t>(point.measuredAt ? ToEpochMs(*point.measuredAt) : 0);
}

Point ReadPoint(ByteReader& reader, uint32_t schemaVersion) {
    Point point;
    point.id = reader.Read<int32_t>();
    point.x = reader.Read<int32_t>();
    point.y = reader.Read<int32_t>();

    uint8_t shape = reader.Read<uint8_t>();
    if (shape > static_cast<uint8_t>(PointShape::Rectangle)) {
        throw CorruptContainerException("LoadProject: invalid shape " + std::to_string(shape) +
                                        " for point #" + std::to_string(point.id));
    }
    point.shape = static_cast<PointShape>(shape);

    uint8_t flags = reader.Read<uint8_t>();
    int32_t radius = reader.Read<int32_t>();
    int32_t width = reader.Read<int32_t>();
    int32_t height = reader.Read<int32_t>();
    double reference = reader.Read<double>();
    double compare = reader.Read<double>();

    if (flags & HAS_RADIUS) point.radius = radius;
    if (flags & HAS_WIDTH) point.width = width;
    if (flags & HAS_HEIGHT) point.height = height;
    if (flags & HAS_REFERENCE) point.referenceValue = reference;
    if (flags & HAS_COMPARE) point.compareValue = compare;

    if (schemaVersion >= 2) {
        point.referenceUnit = reader.ReadString();
        point.compareUnit = reader.ReadString();
    } else {
        // Schema 1 kept one unit for whichever readings were present
        std::string unit = reader.ReadString();
        if (point.referenceValue) point.referenceUnit = unit;
        if (point.compareValue) point.compareUnit = unit;
    }
    point.name = reader.ReadString();
    point.description = reader.ReadString();
    point.componentType = reader.ReadString();
    point.expectedValue = reader.ReadString();
    point.createdAt = FromEpochMs(reader.Read<int64_t>());
    point.updatedAt = FromEpochMs(reader.Read<int64_t>());

    int64_t measuredAt = reader.Read<int64_t>();
    if (flags & HAS_MEASURED_AT) point.measuredAt = FromEpochMs(measuredAt);
    return point;
}

std::vector<uint8_t> EncodeProjectEntry(const ProjectData& data) {
    ByteWriter writer;
    writer.Write<uint32_t>(SCHEMA_VERSION);
    writer.WriteString(data.info.name);
    writer.WriteString(data.info.boardModel);
    writer.WriteString(data.info.description);
    writer.Write<uint8_t>(data.info.isFullyFunctional ? 1 : 0);
    writer.Write<double>(data.tolerancePercent);
    writer.Write<int64_t>(ToEpochMs(data.createdAt));
    writer.Write<int64_t>(ToEpochMs(data.modifiedAt));
    writer.Write<int32_t>(data.nextPointId);

    writer.Write<uint32_t>(static_cast<uint32_t>(data.points.size()));
    for (const auto& point : data.points) {
        WritePoint(writer, point);
    }
    return writer.Release();
}

/// Decode everything but the image
ProjectData DecodeProjectEntry(const std::vector<uint8_t>& bytes,
                               uint32_t* schemaVersionOut = nullptr) {
    if (bytes.size() < sizeof(uint32_t)) {
        throw FormatException("LoadProject: project entry has no schema_version");
    }

    ByteReader reader(bytes);
    uint32_t schemaVersion = reader.Read<uint32_t>();
    if (schemaVersion < MIN_SCHEMA_VERSION || schemaVersion > SCHEMA_VERSION) {
        throw FormatException("LoadProject: unsupported schema_version " +
                              std::to_string(schemaVersion));
    }

    ProjectData data;
    data.info.name = reader.ReadString();
    data.info.boardModel = reader.ReadString();
    data.info.description = reader.ReadString();
    data.info.isFullyFunctional = reader.Read<uint8_t>() != 0;
    data.tolerancePercent = reader.Read<double>();
    data.createdAt = FromEpochMs(reader.Read<int64_t>());
    data.modifiedAt = FromEpochMs(reader.Read<int64_t>());
    data.nextPointId = reader.Read<int32_t>();

    uint32_t pointCount = reader.Read<uint32_t>();
    if (reader.Overrun() || pointCount > MAX_POINTS) {
        throw CorruptContainerException("LoadProject: invalid point count " +
                                        std::to_string(pointCount));
    }

    data.points.reserve(pointCount);
    for (uint32_t i = 0; i < pointCount && !reader.Overrun(); ++i) {
        data.points.push_back(ReadPoint(reader, schemaVersion));
    }

    if (reader.Overrun()) {
        throw CorruptContainerException("LoadProject: project entry is truncated");
    }
    if (schemaVersionOut) {
        *schemaVersionOut = schemaVersion;
    }
    return data;
}

// =============================================================================
// Manifest
// =============================================================================

std::vector<uint8_t> EncodeManifest(const EntryMap& entries) {
    ByteWriter writer;
    writer.Write<uint32_t>(static_cast<uint32_t>(entries.size()));
    for (const auto& [name, bytes] : entries) {
        writer.WriteString(name);
        writer.Write<uint64_t>(bytes.size());
        writer.Write<uint32_t>(Platform::Crc32(bytes));
    }
    return writer.Release();
}

void VerifyManifest(const EntryMap& entries) {
    auto it = entries.find(ENTRY_MANIFEST);
    if (it == entries.end()) {
        return;
    }

    ByteReader reader(it->second);
    uint32_t count = reader.Read<uint32_t>();
    if (reader.Overrun() || count > MAX_ENTRIES) {
        throw CorruptContainerException("manifest is unreadable");
    }

    for (uint32_t i = 0; i < count; ++i) {
        std::string name = reader.ReadString();
        uint64_t size = reader.Read<uint64_t>();
        uint32_t crc = reader.Read<uint32_t>();
        if (reader.Overrun()) {
            throw CorruptContainerException("manifest is truncated");
        }

        auto entry = entries.find(name);
        if (entry == entries.end()) {
            throw CorruptContainerException("manifest lists missing entry '" + name + "'");
        }
        if (entry->second.size() != size) {
            throw CorruptContainerException("entry '" + name + "' size mismatch: expected " +
                                            std::to_string(size) + ", got " +
                                            std::to_string(entry->second.size()));
        }
        if (Platform::Crc32(entry->second) != crc) {
            throw CorruptContainerException("entry '" + name + "' checksum mismatch");
        }
    }
}

// =============================================================================
// Container framing
// =============================================================================

std::vector<uint8_t> EncodeContainer(const EntryMap& entries, bool writeManifest) {
    ByteWriter writer;
    writer.WriteBytes(CONTAINER_MAGIC, sizeof(CONTAINER_MAGIC));
    writer.Write<uint32_t>(CONTAINER_VERSION);

    uint32_t count = static_cast<uint32_t>(entries.size()) + (writeManifest ? 1 : 0);
    writer.Write<uint32_t>(count);

    // image first, then project, then manifest
    for (const char* name : {ENTRY_IMAGE, ENTRY_PROJECT}) {
        const auto& bytes = entries.at(name);
        writer.WriteString(name);
        writer.Write<uint64_t>(bytes.size());
        writer.WriteBytes(bytes.data(), bytes.size());
    }

    if (writeManifest) {
        std::vector<uint8_t> manifest = EncodeManifest(entries);
        writer.WriteString(ENTRY_MANIFEST);
        writer.Write<uint64_t>(manifest.size());
        writer.WriteBytes(manifest.data(), manifest.size());
    }
    return writer.Release();
}

EntryMap DecodeContainer(const std::vector<uint8_t>& buffer) {
    if (buffer.size() < sizeof(CONTAINER_MAGIC) ||
        std::memcmp(buffer.data(), CONTAINER_MAGIC, sizeof(CONTAINER_MAGIC)) != 0) {
        throw FormatException("not a MIP container (magic mismatch)");
    }
    if (buffer.size() < HEADER_SIZE) {
        throw CorruptContainerException("container header is truncated");
    }

    ByteReader reader(buffer);
    char magic[sizeof(CONTAINER_MAGIC)];
    reader.ReadBytes(magic, sizeof(magic));

    uint32_t version = reader.Read<uint32_t>();
    if (version != CONTAINER_VERSION) {
        throw FormatException("unsupported container version " + std::to_string(version));
    }

    uint32_t count = reader.Read<uint32_t>();
    if (count > MAX_ENTRIES) {
        throw CorruptContainerException("invalid entry count " + std::to_string(count));
    }

    EntryMap entries;
    for (uint32_t i = 0; i < count; ++i) {
        std::string name = reader.ReadString();
        uint64_t size = reader.Read<uint64_t>();
        if (reader.Overrun() || size > reader.Remaining()) {
            throw CorruptContainerException("container is truncated");
        }

        std::vector<uint8_t> bytes = reader.ReadBlock(static_cast<size_t>(size));
        if (!entries.emplace(name, std::move(bytes)).second) {
            throw CorruptContainerException("duplicate entry '" + name + "'");
        }
    }

    if (!reader.AtEnd()) {
        Log::Warning("MIP container has " + std::to_string(reader.Remaining()) +
                     " trailing bytes");
    }

    VerifyManifest(entries);

    for (const auto& entry : entries) {
        if (entry.first != ENTRY_IMAGE && entry.first != ENTRY_PROJECT &&
            entry.first != ENTRY_MANIFEST) {
            Log::Warning("Ignoring unknown container entry '" + entry.first + "'");
        }
    }
    for (const char* name : {ENTRY_IMAGE, ENTRY_PROJECT}) {
        if (entries.find(name) == entries.end()) {
            throw FormatException(std::string("missing mandatory entry '") + name + "'");
        }
    }
    return entries;
}

std::vector<uint8_t> ReadFileOrThrow(const std::string& path, const char* funcName) {
    std::vector<uint8_t> buffer;
    if (!Platform::ReadBinaryFile(path, buffer)) {
        throw IOException(std::string(funcName) + ": failed to read file: " + path);
    }
    return buffer;
}

// =============================================================================
// Text export
// =============================================================================

std::string JsonString(const std::string& text) {
    std::string out = "\"";
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (ch) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += ch;
                }
        }
    }
    return out + "\"";
}

std::string JsonNumber(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.10g", value);
    return buf;
}

template<typename T>
std::string JsonOptional(const std::optional<T>& value) {
    if (!value) {
        return "null";
    }
    return JsonNumber(static_cast<double>(*value));
}

std::string JsonTimestamp(Timestamp ts) {
    return "{ \"iso\": " + JsonString(FormatTimestamp(ts)) +
           ", \"epochMs\": " + std::to_string(ToEpochMs(ts)) + " }";
}

/// Appends "<indent>"key": value" with the separator of the previous field
class JsonObjectWriter {
public:
    JsonObjectWriter(std::string& out, int32_t depth) : out_(out), depth_(depth) {
        out_ += "{";
    }

    void Field(const std::string& key, const std::string& rawValue) {
        out_ += first_ ? "\n" : ",\n";
        first_ = false;
        out_ += std::string(static_cast<size_t>(depth_ + 1) * 2, ' ');
        out_ += JsonString(key) + ": " + rawValue;
    }

    void Close() {
        out_ += "\n" + std::string(static_cast<size_t>(depth_) * 2, ' ') + "}";
    }

private:
    std::string& out_;
    int32_t depth_;
    bool first_ = true;
};

std::string FormatPoint(const Point& point, int32_t depth) {
    std::string out;
    JsonObjectWriter obj(out, depth);
    obj.Field("id", std::to_string(point.id));
    obj.Field("shape", JsonString(ShapeName(point.shape)));
    obj.Field("x", std::to_string(point.x));
    obj.Field("y", std::to_string(point.y));
    obj.Field("radius", JsonOptional(point.radius));
    obj.Field("width", JsonOptional(point.width));
    obj.Field("height", JsonOptional(point.height));
    obj.Field("name", JsonString(point.name));
    obj.Field("description", JsonString(point.description));
    obj.Field("componentType", JsonString(point.componentType));
    obj.Field("expectedValue", JsonString(point.expectedValue));
    obj.Field("referenceValue", JsonOptional(point.referenceValue));
    obj.Field("referenceUnit", JsonString(point.referenceUnit));
    obj.Field("compareValue", JsonOptional(point.compareValue));
    obj.Field("compareUnit", JsonString(point.compareUnit));
    obj.Field("createdAt", JsonTimestamp(point.createdAt));
    obj.Field("updatedAt", JsonTimestamp(point.updatedAt));
    obj.Field("measuredAt", point.measuredAt ? JsonTimestamp(*point.measuredAt)
                                             : std::string("null"));
    obj.Close();
    return out;
}

} // anonymous namespace

// =============================================================================
// Save
// =============================================================================

std::vector<uint8_t> SaveToBuffer(const Project& project, const SaveOptions& options) {
    ProjectData data = project.Snapshot();

    EntryMap entries;
    entries[ENTRY_IMAGE] = data.image.Empty() ? std::vector<uint8_t>()
                                              : IO::EncodePng(data.image);
    entries[ENTRY_PROJECT] = EncodeProjectEntry(data);

    return EncodeContainer(entries, options.writeManifest);
}

void SaveProject(const Project& project, const std::string& path, const SaveOptions& options) {
    Platform::ScopedTimer timer("SaveProject");

    std::vector<uint8_t> buffer = SaveToBuffer(project, options);
    if (!Platform::WriteBinaryFileAtomic(path, buffer)) {
        throw IOException("SaveProject: failed to write file: " + path);
    }

    Log::Info("Saved project '" + project.Name() + "' to " + path + " (" +
              std::to_string(buffer.size()) + " bytes)");
}

// =============================================================================
// Load
// =============================================================================

Project LoadFromBuffer(const std::vector<uint8_t>& buffer) {
    EntryMap entries = DecodeContainer(buffer);

    ProjectData data = DecodeProjectEntry(entries.at(ENTRY_PROJECT));

    const std::vector<uint8_t>& imageBytes = entries.at(ENTRY_IMAGE);
    if (!imageBytes.empty()) {
        try {
            data.image = IO::DecodeImage(imageBytes);
        } catch (const IOException& e) {
            throw CorruptContainerException(std::string("image entry: ") + e.what());
        }
    }

    try {
        return Project(std::move(data));
    } catch (const ValidationException& e) {
        throw CorruptContainerException(std::string("project entry: ") + e.what());
    }
}

Project LoadProject(const std::string& path) {
    Platform::ScopedTimer timer("LoadProject");

    std::vector<uint8_t> buffer = ReadFileOrThrow(path, "LoadProject");
    Project project = LoadFromBuffer(buffer);

    Log::Info("Loaded project '" + project.Name() + "' from " + path + " (" +
              std::to_string(project.PointCount()) + " points)");
    return project;
}

// =============================================================================
// Inspection
// =============================================================================

ProjectFileInfo ReadProjectInfo(const std::string& path) {
    std::vector<uint8_t> buffer = ReadFileOrThrow(path, "ReadProjectInfo");
    EntryMap entries = DecodeContainer(buffer);
    uint32_t schemaVersion = 0;
    ProjectData data = DecodeProjectEntry(entries.at(ENTRY_PROJECT), &schemaVersion);

    ProjectFileInfo info;
    info.name = data.info.name;
    info.boardModel = data.info.boardModel;
    info.pointCount = data.points.size();
    info.hasImage = !entries.at(ENTRY_IMAGE).empty();
    info.fileSize = static_cast<int64_t>(buffer.size());
    info.schemaVersion = schemaVersion;
    info.createdAt = data.createdAt;
    info.modifiedAt = data.modifiedAt;
    return info;
}

// =============================================================================
// Export
// =============================================================================

std::string FormatProjectText(const std::vector<uint8_t>& buffer) {
    EntryMap entries = DecodeContainer(buffer);
    uint32_t schemaVersion = 0;
    ProjectData data = DecodeProjectEntry(entries.at(ENTRY_PROJECT), &schemaVersion);

    std::string entryList = "[";
    bool firstEntry = true;
    for (const auto& [name, bytes] : entries) {
        entryList += firstEntry ? " " : ", ";
        firstEntry = false;
        entryList += "{ \"name\": " + JsonString(name) +
                     ", \"size\": " + std::to_string(bytes.size()) + " }";
    }
    entryList += firstEntry ? "]" : " ]";

    std::string pointList;
    if (data.points.empty()) {
        pointList = "[]";
    } else {
        pointList = "[\n";
        for (size_t i = 0; i < data.points.size(); ++i) {
            pointList += "    " + FormatPoint(data.points[i], 2);
            pointList += (i + 1 < data.points.size()) ? ",\n" : "\n";
        }
        pointList += "  ]";
    }

    const std::vector<uint8_t>& png = entries.at(ENTRY_IMAGE);
    std::string image = png.empty() ? std::string("null")
                                    : "{ \"format\": \"png\", \"size\": " +
                                      std::to_string(png.size()) + " }";

    std::string out;
    JsonObjectWriter root(out, 0);
    root.Field("containerVersion", std::to_string(CONTAINER_VERSION));
    root.Field("schemaVersion", std::to_string(schemaVersion));
    root.Field("entries", entryList);
    root.Field("name", JsonString(data.info.name));
    root.Field("boardModel", JsonString(data.info.boardModel));
    root.Field("description", JsonString(data.info.description));
    root.Field("isFullyFunctional", data.info.isFullyFunctional ? "true" : "false");
    root.Field("tolerancePercent", JsonNumber(data.tolerancePercent));
    root.Field("createdAt", JsonTimestamp(data.createdAt));
    root.Field("modifiedAt", JsonTimestamp(data.modifiedAt));
    root.Field("nextPointId", std::to_string(data.nextPointId));
    root.Field("image", image);
    root.Field("points", pointList);
    root.Close();
    return out + "\n";
}

void ExportText(const std::string& projectPath, const std::string& outputPath) {
    std::string text = FormatProjectText(ReadFileOrThrow(projectPath, "ExportText"));
    if (!Platform::WriteTextFile(outputPath, text)) {
        throw IOException("ExportText: failed to write file: " + outputPath);
    }
    Log::Info("Exported " + projectPath + " to " + outputPath);
}

bool IsProjectFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    char magic[sizeof(CONTAINER_MAGIC)] = {};
    file.read(magic, sizeof(magic));
    return file.gcount() == static_cast<std::streamsize>(sizeof(magic)) &&
           std::memcmp(magic, CONTAINER_MAGIC, sizeof(magic)) == 0;
}

} // namespace Mi::Probe::Persistence
