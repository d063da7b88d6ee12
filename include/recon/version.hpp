#pragma once

/**
 * @file version.hpp
 * @brief recon version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace recon {

/// recon version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Document versions read and written by this build
constexpr const char* kBuildSessionSchema = "build_session.v1";
constexpr const char* kResultsSchema = "results.v1";
constexpr const char* kSummarySchema = "summary.v1";
constexpr const char* kConfigSchema = "config.v1";

}  // namespace recon
