/**
 * @file json_utils.h
 * @brief Minimal JSON helpers for the REST api and persisted snapshots
 *
 * Values are handled as raw JSON text. Lookups only match members at the top
 * level of the given object, so a nested object with the same key is never
 * picked up by mistake.
 */

#ifndef CUSTODY_UPLOAD_CORE_JSON_UTILS_H
#define CUSTODY_UPLOAD_CORE_JSON_UTILS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace custody::upload::json_utils {

/**
 * @brief Escape a string for inclusion between JSON quotes
 */
[[nodiscard]] auto escape(std::string_view input) -> std::string;

/**
 * @brief Reverse escape() for the content of a JSON string
 */
[[nodiscard]] auto unescape(std::string_view input) -> std::string;

/**
 * @brief Quote and escape a string
 */
[[nodiscard]] auto quote(std::string_view input) -> std::string;

/**
 * @brief Raw text of a top-level member of a JSON object
 * @return std::nullopt if @p object is not an object or the key is absent
 */
[[nodiscard]] auto member(std::string_view object, std::string_view key)
    -> std::optional<std::string>;

/**
 * @brief Unescaped value of a top-level string member
 * @return std::nullopt if absent, null, or not a string
 */
[[nodiscard]] auto string_member(std::string_view object, std::string_view key)
    -> std::optional<std::string>;

/**
 * @brief Value of a top-level non-negative integer member
 */
[[nodiscard]] auto uint_member(std::string_view object, std::string_view key)
    -> std::optional<uint64_t>;

/**
 * @brief Raw text of each element of a JSON array
 * @return std::nullopt if @p array is not a well-formed array
 */
[[nodiscard]] auto array_elements(std::string_view array)
    -> std::optional<std::vector<std::string>>;

/**
 * @brief Check whether text is a JSON object
 */
[[nodiscard]] auto is_object(std::string_view text) -> bool;

/**
 * @brief Check whether raw value text is the literal null
 */
[[nodiscard]] auto is_null(std::string_view value) -> bool;

}  // namespace custody::upload::json_utils

#endif  // CUSTODY_UPLOAD_CORE_JSON_UTILS_H
