#pragma once

/**
 * @file version.hpp
 * @brief docfmt version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace docfmt {

/// docfmt version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

}  // namespace docfmt
