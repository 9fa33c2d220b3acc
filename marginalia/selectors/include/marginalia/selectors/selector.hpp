/**
 * @file selector.hpp
 * @brief Annotation selector records
 *
 * An annotation's target carries a JSON array of selectors, each an
 * object with a "type" discriminator. Only TextQuoteSelector is
 * modelled; every other element is kept as raw JSON.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <variant>
#include <vector>

namespace marginalia::selectors {

/// Discriminator value of a text quote selector
constexpr const char* kTextQuoteSelectorType = "TextQuoteSelector";

/**
 * @brief Quote of the annotated text with surrounding context
 *
 * prefix/exact/suffix are std::nullopt when the key is absent. A present
 * key keeps its JSON value as-is (normally a string, possibly null).
 */
struct TextQuoteSelector {
    std::optional<nlohmann::json> prefix;
    std::optional<nlohmann::json> exact;
    std::optional<nlohmann::json> suffix;

    /// Remaining keys of the record, "type" included
    nlohmann::json rest = nlohmann::json::object();
};

/// Any element that is not a TextQuoteSelector object
struct OtherSelector {
    nlohmann::json raw;
};

using Selector = std::variant<TextQuoteSelector, OtherSelector>;

/// Classify one array element
Selector selectorFromJson(const nlohmann::json& element);

/// Rebuild the JSON element
nlohmann::json selectorToJson(const Selector& selector);

/// Classify every element of an array. Precondition: document.is_array().
std::vector<Selector> selectorsFromJson(const nlohmann::json& document);

nlohmann::json selectorsToJson(const std::vector<Selector>& records);

} // namespace marginalia::selectors
