#pragma once

/**
 * @file VisMatch.h
 * @brief Main header file for VisMatch library
 *
 * VisMatch ranks images by visual similarity to a query image using
 * color, spatial block and edge features, with optional re-ranking by
 * structured attribute tags.
 *
 * @author VisMatch Team
 * @version 0.1.0
 */

// Configuration and export macros
#include <VisMatch/VisMatchConfig.h>
#include <VisMatch/Core/Export.h>

// Core types and utilities
#include <VisMatch/Core/Types.h>
#include <VisMatch/Core/Constants.h>
#include <VisMatch/Core/Exception.h>
#include <VisMatch/Core/Image.h>

// Platform abstraction
#include <VisMatch/Platform/Logging.h>
#include <VisMatch/Platform/Thread.h>
#include <VisMatch/Platform/Timer.h>

// Feature modules
#include <VisMatch/IO/ImageSource.h>
#include <VisMatch/Feature/FeatureExtractor.h>
#include <VisMatch/Feature/KeyValueStore.h>
#include <VisMatch/Feature/FeatureCache.h>
#include <VisMatch/Matching/SimilarityScorer.h>
#include <VisMatch/Matching/BatchMatcher.h>
#include <VisMatch/Matching/TagSimilarity.h>
#include <VisMatch/Matching/SimilaritySearch.h>

namespace Vis::Match {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return VISMATCH_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = VISMATCH_VERSION_MAJOR;
    minor = VISMATCH_VERSION_MINOR;
    patch = VISMATCH_VERSION_PATCH;
}

} // namespace Vis::Match
