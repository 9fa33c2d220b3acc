/**
 * @file selector.cpp
 * @brief Selector record conversion
 */

#include <marginalia/selectors/selector.hpp>

namespace marginalia::selectors {

namespace {

std::optional<nlohmann::json> takeField(nlohmann::json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end()) {
        return std::nullopt;
    }
    nlohmann::json value = std::move(*it);
    record.erase(it);
    return value;
}

void putField(nlohmann::json& record, const char* key, const std::optional<nlohmann::json>& value) {
    if (value) {
        record[key] = *value;
    }
}

bool isTextQuoteSelector(const nlohmann::json& element) {
    if (!element.is_object()) {
        return false;
    }
    auto type = element.find("type");
    return type != element.end() && type->is_string()
        && type->get_ref<const std::string&>() == kTextQuoteSelectorType;
}

} // anonymous namespace

Selector selectorFromJson(const nlohmann::json& element) {
    if (!isTextQuoteSelector(element)) {
        return OtherSelector{element};
    }

    TextQuoteSelector quote;
    quote.rest = element;
    quote.prefix = takeField(quote.rest, "prefix");
    quote.exact = takeField(quote.rest, "exact");
    quote.suffix = takeField(quote.rest, "suffix");
    return quote;
}

nlohmann::json selectorToJson(const Selector& selector) {
    if (const auto* other = std::get_if<OtherSelector>(&selector)) {
        return other->raw;
    }

    const auto& quote = std::get<TextQuoteSelector>(selector);
    nlohmann::json record = quote.rest;
    putField(record, "prefix", quote.prefix);
    putField(record, "exact", quote.exact);
    putField(record, "suffix", quote.suffix);
    return record;
}

std::vector<Selector> selectorsFromJson(const nlohmann::json& document) {
    std::vector<Selector> out;
    out.reserve(document.size());
    for (const auto& element : document) {
        out.push_back(selectorFromJson(element));
    }
    return out;
}

nlohmann::json selectorsToJson(const std::vector<Selector>& records) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& selector : records) {
        out.push_back(selectorToJson(selector));
    }
    return out;
}

} // namespace marginalia::selectors
