#pragma once

/**
 * @file version.hpp
 * @brief jsonassert version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace jsonassert {

/// jsonassert version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions of the documents jsonassert reads and writes
constexpr const char* kReportSchemaVersion = "diff_report.v1";
constexpr const char* kCasesSchemaVersion = "cases.v1";

}  // namespace jsonassert
