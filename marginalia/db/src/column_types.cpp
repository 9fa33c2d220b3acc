/**
 * @file column_types.cpp
 * @brief Column conversion implementation
 */

#include <marginalia/db/column_types.hpp>
#include <marginalia/ids/url_safe_id.hpp>
#include <marginalia/selectors/null_escape.hpp>

namespace marginalia::db {

namespace {

Result<std::optional<std::string>> someOrError(Result<std::string> converted) {
    if (!converted) {
        return converted.error();
    }
    return std::optional<std::string>(std::move(converted).value());
}

} // anonymous namespace

Result<std::optional<std::string>> UrlSafeUuidColumn::bind(const nlohmann::json& value) {
    if (value.is_null()) {
        return std::optional<std::string>();
    }
    return someOrError(ids::decodeValue(value));
}

Result<std::optional<std::string>> UrlSafeUuidColumn::result(const std::optional<std::string>& stored) {
    if (!stored) {
        return std::optional<std::string>();
    }
    return someOrError(ids::encode(*stored));
}

nlohmann::json AnnotationSelectorColumn::bind(const nlohmann::json& document) {
    return selectors::escape(document);
}

nlohmann::json AnnotationSelectorColumn::result(const nlohmann::json& stored) {
    return selectors::unescape(stored);
}

} // namespace marginalia::db
