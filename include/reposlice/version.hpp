#pragma once

/**
 * @file version.hpp
 * @brief reposlice version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace reposlice {

/// reposlice version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions of the JSON documents this build reads and writes
constexpr const char* kRequestSchemaVersion = "slice_request.v1";
constexpr const char* kReportSchemaVersion = "slice_report.v1";
constexpr const char* kConfigSchemaVersion = "analysis_config.v1";

}  // namespace reposlice
