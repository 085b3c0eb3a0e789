#pragma once

/**
 * @file ProjectCodec.h
 * @brief Project save/load in the MIP container format
 *
 * Container layout (little-endian integers and IEEE-754 doubles, strings
 * uint64 length-prefixed):
 *
 *   "MIPC"                 4 bytes magic
 *   uint32 version         container version (1)
 *   uint32 entryCount
 *   entryCount x { string name; uint64 size; size bytes }
 *
 * Entries:
 *   image     PNG (empty when the project has no image)
 *   project   structured metadata, first field uint32 schema_version
 *   manifest  optional; per entry { string name; uint64 size; uint32 crc32 }
 *
 * Errors:
 *   FormatException           bad magic, unsupported container or schema
 *                             version, missing mandatory entry
 *   CorruptContainerException truncated data, manifest mismatch, undecodable
 *                             image, invalid project content
 *   IOException               file cannot be read or written
 */

#include <MiProbe/Core/Export.h>
#include <MiProbe/Core/Types.h>
#include <MiProbe/Model/Project.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Mi::Probe::Persistence {

// =============================================================================
// Constants
// =============================================================================

/// Container magic bytes
constexpr char CONTAINER_MAGIC[4] = {'M', 'I', 'P', 'C'};

/// Container framing version
constexpr uint32_t CONTAINER_VERSION = 1;

/// Version of the "project" entry layout written by SaveProject
constexpr uint32_t SCHEMA_VERSION = 2;

/// Oldest "project" entry layout LoadProject still reads (one unit per point)
constexpr uint32_t MIN_SCHEMA_VERSION = 1;

/// Conventional file extension
constexpr const char* PROJECT_FILE_EXTENSION = ".mip";

// Entry names
constexpr const char* ENTRY_IMAGE = "image";
constexpr const char* ENTRY_PROJECT = "project";
constexpr const char* ENTRY_MANIFEST = "manifest";

// =============================================================================
// Types
// =============================================================================

struct MIPROBE_API SaveOptions {
    bool writeManifest = true;      ///< Append per-entry size + CRC-32

    SaveOptions& SetWriteManifest(bool w) { writeManifest = w; return *this; }
};

/**
 * @brief Project header read without decoding the image
 */
struct MIPROBE_API ProjectFileInfo {
    std::string name;
    std::string boardModel;
    size_t pointCount = 0;
    bool hasImage = false;
    int64_t fileSize = 0;
    uint32_t schemaVersion = 0;
    Timestamp createdAt{};
    Timestamp modifiedAt{};
};

// =============================================================================
// Save / Load
// =============================================================================

/**
 * @brief Save project to file
 *
 * The project is snapshotted under its lock, so a save may run while an
 * acquisition is in progress. The file is written to "<path>.tmp" and renamed
 * into place; on failure the destination is left untouched.
 *
 * @throws IOException if the file cannot be written
 */
MIPROBE_API void SaveProject(const Project& project, const std::string& path,
                             const SaveOptions& options = SaveOptions());

/**
 * @brief Load project from file
 * @throws IOException, FormatException, CorruptContainerException
 */
MIPROBE_API Project LoadProject(const std::string& path);

/// Encode project into an in-memory container
MIPROBE_API std::vector<uint8_t> SaveToBuffer(const Project& project,
                                              const SaveOptions& options = SaveOptions());

/// Decode project from an in-memory container
MIPROBE_API Project LoadFromBuffer(const std::vector<uint8_t>& buffer);

// =============================================================================
// Inspection
// =============================================================================

/**
 * @brief Read name, board model and counts without decoding the image
 * @throws IOException, FormatException, CorruptContainerException
 */
MIPROBE_API ProjectFileInfo ReadProjectInfo(const std::string& path);

/**
 * @brief Check whether path starts with the container magic
 */
MIPROBE_API bool IsProjectFile(const std::string& path);

// =============================================================================
// Export
// =============================================================================

/**
 * @brief Render a container as indented JSON for inspection
 *
 * Lists the entries with their sizes and the complete project entry (info,
 * tolerance, points with readings and units, timestamps as ISO-8601 and epoch
 * ms). The image is summarized by its PNG size. Missing values are null.
 *
 * @throws FormatException, CorruptContainerException
 */
MIPROBE_API std::string FormatProjectText(const std::vector<uint8_t>& buffer);

/**
 * @brief Write FormatProjectText of the file at projectPath to outputPath
 * @throws IOException, FormatException, CorruptContainerException
 */
MIPROBE_API void ExportText(const std::string& projectPath, const std::string& outputPath);

} // namespace Mi::Probe::Persistence
