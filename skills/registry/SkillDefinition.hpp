/**
 * @file skills/registry/SkillDefinition.hpp
 * @brief Declarative skill definitions (skills.json) and their parser.
 *
 * Format:
 * @code
 * { "skills": [
 *     { "id": "education_assistant", "featureBuilder": "education",
 *       "triggers": ["education", "learning"], "inputDim": 64 } ] }
 * @endcode
 * "triggers" and "inputDim" are optional.
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace SkillRuntime::Skills {

/// @brief Raised for a malformed or inconsistent definition document.
class SkillDefinitionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief One skill entry of a definition document.
struct SkillDefinition {
    std::string id;
    std::string feature_builder;
    std::vector<std::string> triggers;
    std::size_t input_dim{64};
};

/**
 * @brief Parse and validate a whole definition document.
 *
 * Either every entry is valid and returned, or nothing is: the first problem
 * (bad JSON, missing field, wrong type, empty or duplicate id, non-positive
 * inputDim) throws.
 *
 * @throws SkillDefinitionError describing the first problem found.
 */
[[nodiscard]] std::vector<SkillDefinition> parse_skill_definitions(const std::string& document);

/// @brief Read a definition document from disk.
/// @throws SkillDefinitionError if the file cannot be read.
[[nodiscard]] std::string read_definition_file(const std::string& path);

} // namespace SkillRuntime::Skills
