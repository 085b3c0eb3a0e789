#pragma once

/**
 * @file MiProbe.h
 * @brief Main header file for MiProbe library
 *
 * MiProbe maps measurement points onto a circuit board photograph, acquires
 * multimeter readings for each point over a serial link and compares a
 * reference board against a board under test.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <MiProbe/MiProbeConfig.h>
#include <MiProbe/Core/Export.h>

// Core types and utilities
#include <MiProbe/Core/Types.h>
#include <MiProbe/Core/Exception.h>

// Platform abstraction
#include <MiProbe/Platform/Log.h>
#include <MiProbe/Platform/Timer.h>

// Data model
#include <MiProbe/IO/BoardImage.h>
#include <MiProbe/IO/ImageStore.h>
#include <MiProbe/Model/Point.h>
#include <MiProbe/Model/Project.h>

// Feature modules
#include <MiProbe/Comparison/Comparison.h>
#include <MiProbe/Persistence/ProjectCodec.h>
#include <MiProbe/Serial/SerialChannel.h>
#include <MiProbe/Serial/FrameCodec.h>
#include <MiProbe/Serial/SimulatedMeter.h>
#include <MiProbe/Acquisition/Acquisition.h>
#include <MiProbe/Config/Settings.h>
#include <MiProbe/Workflow/SessionContext.h>
#include <MiProbe/Workflow/WorkflowController.h>

namespace Mi::Probe {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return MIPROBE_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = MIPROBE_VERSION_MAJOR;
    minor = MIPROBE_VERSION_MINOR;
    patch = MIPROBE_VERSION_PATCH;
}

} // namespace Mi::Probe
