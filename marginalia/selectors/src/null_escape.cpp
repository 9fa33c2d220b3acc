/**
 * @file null_escape.cpp
 * @brief NUL escaping implementation
 */

#include <marginalia/selectors/null_escape.hpp>
#include <marginalia/core/logger.hpp>

namespace marginalia::selectors {

namespace {

std::string replaceAll(std::string_view text, std::string_view from, std::string_view to) {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    for (auto hit = text.find(from); hit != std::string_view::npos; hit = text.find(from, pos)) {
        out.append(text.substr(pos, hit - pos));
        out.append(to);
        pos = hit + from.size();
    }
    out.append(text.substr(pos));
    return out;
}

void transformField(std::optional<nlohmann::json>& field, TextTransform transform) {
    // null (or any other non-string) passes through
    if (field && field->is_string()) {
        *field = transform(field->get_ref<const std::string&>());
    }
}

} // anonymous namespace

std::string escapeNullBytes(std::string_view text) {
    return replaceAll(text, std::string_view("\0", 1), kEscapedNull);
}

std::string unescapeNullBytes(std::string_view text) {
    return replaceAll(text, kEscapedNull, std::string_view("\0", 1));
}

TextQuoteSelector transformQuote(const TextQuoteSelector& quote, TextTransform transform) {
    TextQuoteSelector out = quote;
    transformField(out.prefix, transform);
    transformField(out.exact, transform);
    transformField(out.suffix, transform);
    return out;
}

nlohmann::json transformSelectors(const nlohmann::json& document, TextTransform transform) {
    if (!document.is_array()) {
        return document;
    }

    auto records = selectorsFromJson(document);
    std::size_t quotes = 0;
    for (auto& record : records) {
        if (auto* quote = std::get_if<TextQuoteSelector>(&record)) {
            *quote = transformQuote(*quote, transform);
            ++quotes;
        }
    }

    MARGINALIA_LOG_TRACE("Transformed {} of {} selectors", quotes, records.size());
    return selectorsToJson(records);
}

nlohmann::json escape(const nlohmann::json& document) {
    return transformSelectors(document, &escapeNullBytes);
}

nlohmann::json unescape(const nlohmann::json& document) {
    return transformSelectors(document, &unescapeNullBytes);
}

} // namespace marginalia::selectors
