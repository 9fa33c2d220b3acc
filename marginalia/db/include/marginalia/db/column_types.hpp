/**
 * @file column_types.hpp
 * @brief Conversions applied at the annotation table's column boundary
 *
 * bind() runs on a value the application is about to write, result()
 * on a value just read back. SQL NULL (std::nullopt / JSON null) passes
 * through both directions.
 */

#pragma once

#include <marginalia/core/result.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace marginalia::db {

/**
 * @brief UUID column exposed to the application as URL-safe strings
 *
 * Storage holds a PostgreSQL UUID; the application sees 22-character
 * identifiers, or 20-character ones for rows imported from the search
 * index. Errors are request validation failures (a bad or unknown ID),
 * not storage faults.
 */
class UrlSafeUuidColumn {
public:
    /// Application value (string or null) to storage hex
    static Result<std::optional<std::string>> bind(const nlohmann::json& value);

    /// Stored UUID text (hex, dashed or braced) to application value
    static Result<std::optional<std::string>> result(const std::optional<std::string>& stored);
};

/**
 * @brief JSONB selector column
 *
 * Escapes NUL in text quote selectors on write and restores it on read.
 * Always applied to the whole selector array.
 */
class AnnotationSelectorColumn {
public:
    static nlohmann::json bind(const nlohmann::json& document);

    static nlohmann::json result(const nlohmann::json& stored);
};

} // namespace marginalia::db
