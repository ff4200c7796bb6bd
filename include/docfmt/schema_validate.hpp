#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema checks for validated documents (valijson)
 */

#include "docfmt/common.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docfmt::common {

/**
 * @brief One failed schema constraint
 */
struct SchemaViolation
{
    std::string pointer;      ///< JSON pointer of the offending value ("/" for the root)
    std::string description;  ///< valijson's description of the constraint

    /// "<pointer>: <description>"
    [[nodiscard]] std::string to_string() const;
};

/**
 * Check a document against a JSON Schema file.
 *
 * "$defs" is accepted as an alias of "definitions", and $ref URIs naming
 * another file are resolved relative to the schema's directory.
 *
 * @return Violations (empty if the document conforms), or
 *         SchemaFileOpenFailed / SchemaParseFailed / SchemaBuildFailed
 */
[[nodiscard]] docfmt::Result<std::vector<SchemaViolation>>
check_against_schema(const nlohmann::json& document, const std::filesystem::path& schema_path);

}  // namespace docfmt::common
