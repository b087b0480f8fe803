#pragma once

/**
 * @file version.hpp
 * @brief jsondelta version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace jsondelta {

/// jsondelta version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Report format version (schemas/report.v1.schema.json)
constexpr const char* kReportFormatVersion = "report.v1";

}  // namespace jsondelta
