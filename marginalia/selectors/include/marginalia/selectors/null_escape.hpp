/**
 * @file null_escape.hpp
 * @brief NUL escaping for text quote selectors
 *
 * The selector column's JSONB storage cannot hold U+0000, so NUL
 * characters in the prefix/exact/suffix of every TextQuoteSelector are
 * written as the six characters \u0000 and restored on read. Nothing
 * else in the document is touched, since other fields may legitimately
 * contain a literal \u0000.
 *
 * escape() and unescape() never fail: values they do not recognize are
 * returned unchanged.
 */

#pragma once

#include <marginalia/selectors/selector.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace marginalia::selectors {

/// Textual escape form of NUL
constexpr std::string_view kEscapedNull = "\\u0000";

using TextTransform = std::string (*)(std::string_view);

/// Replace every NUL with \u0000
std::string escapeNullBytes(std::string_view text);

/// Replace every literal \u0000 with NUL
std::string unescapeNullBytes(std::string_view text);

/// Apply transform to the string-valued prefix/exact/suffix fields
TextQuoteSelector transformQuote(const TextQuoteSelector& quote, TextTransform transform);

/**
 * @brief Apply transform to every TextQuoteSelector in a selector array
 *
 * null and non-array values are returned unchanged. For an array, a new
 * array is built; non-TextQuoteSelector elements are copied as-is.
 */
nlohmann::json transformSelectors(const nlohmann::json& document, TextTransform transform);

/// Escape before writing a selector document
nlohmann::json escape(const nlohmann::json& document);

/// Unescape after reading a selector document
nlohmann::json unescape(const nlohmann::json& document);

} // namespace marginalia::selectors
