/**
 * @file skills/payload/Payload.hpp
 * @brief Heterogeneous key/value payloads handed to skills by collaborators.
 *
 * A payload value is one of number, text, boolean, or list of text. Feature
 * builders read payloads only through the tolerant accessors below: absent
 * or unconvertible fields yield std::nullopt, never an exception.
 */
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace SkillRuntime::Skills {

/// @brief Tagged union of the primitive value kinds a payload may carry.
using PayloadValue = std::variant<double, std::string, bool, std::vector<std::string>>;

/// @brief Ordered key/value payload.
using Payload = std::map<std::string, PayloadValue>;

/// @brief Fixed-length numeric encoding of a payload.
using FeatureVector = std::vector<float>;

/**
 * @brief Numeric view of a field.
 *
 * Numbers pass through, booleans map to 0/1, text is parsed as a number when
 * the whole string is numeric. Lists have no numeric view.
 */
[[nodiscard]] std::optional<double> number_of(const Payload& payload, const std::string& key);

/**
 * @brief Text view of a field.
 *
 * Text passes through; numbers and booleans are rendered as text. Lists have
 * no text view.
 */
[[nodiscard]] std::optional<std::string> text_of(const Payload& payload, const std::string& key);

/// @brief Space-joined non-blank texts of several fields, or nullopt when none is present.
[[nodiscard]] std::optional<std::string> joined_text_of(
    const Payload& payload,
    const std::vector<std::string>& keys
);

/// @brief Element count of a list field, or character count of a text field.
[[nodiscard]] std::optional<double> collection_size_of(const Payload& payload, const std::string& key);

/// @brief 1 for true / non-zero / "true" (any case), 0 otherwise (including absent).
[[nodiscard]] float flag_of(const Payload& payload, const std::string& key);

/**
 * @brief Convert a JSON object into a payload.
 *
 * Numbers, strings, booleans and arrays of strings are kept; arrays with
 * non-string members keep only their string members; other values (null,
 * nested objects) are skipped.
 * @throws std::invalid_argument if @p object is not a JSON object.
 */
[[nodiscard]] Payload payload_from_json(const nlohmann::json& object);

/// @brief Render a payload as a JSON object (for logs and CLI output).
[[nodiscard]] nlohmann::json payload_to_json(const Payload& payload);

} // namespace SkillRuntime::Skills
