#pragma once

/**
 * @file ChtVision.h
 * @brief Main header file for ChtVision library
 *
 * ChtVision detects circles with a phase-coded Circular Hough Transform.
 *
 * @author ChtVision Team
 * @version 0.1.0
 */

// Configuration and export macros
#include <ChtVision/ChtVisionConfig.h>
#include <ChtVision/Core/Export.h>

// Core types and utilities
#include <ChtVision/Core/Types.h>
#include <ChtVision/Core/Constants.h>
#include <ChtVision/Core/Exception.h>

// Core data structures
#include <ChtVision/Core/QImage.h>

// Platform abstraction
#include <ChtVision/Platform/Logger.h>

// Feature modules
#include <ChtVision/Hough/CircleFinder.h>

namespace Cht::Vision {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return CHTVISION_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = CHTVISION_VERSION_MAJOR;
    minor = CHTVISION_VERSION_MINOR;
    patch = CHTVISION_VERSION_PATCH;
}

} // namespace Cht::Vision
