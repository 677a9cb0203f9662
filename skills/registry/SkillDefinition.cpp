/**
 * @file skills/registry/SkillDefinition.cpp
 * @brief Definition document parsing.
 */
#include "SkillDefinition.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <sstream>

namespace SkillRuntime::Skills {
namespace {

std::string entry_label(size_t index) {
    return "skills[" + std::to_string(index) + "]";
}

SkillDefinition parse_entry(const nlohmann::json& entry, size_t index) {
    if (!entry.is_object()) {
        throw SkillDefinitionError(entry_label(index) + " is not an object");
    }

    SkillDefinition def;
    if (!entry.contains("id") || !entry["id"].is_string() || entry["id"].get<std::string>().empty()) {
        throw SkillDefinitionError(entry_label(index) + ".id must be a non-empty string");
    }
    def.id = entry["id"].get<std::string>();

    if (!entry.contains("featureBuilder") || !entry["featureBuilder"].is_string()) {
        throw SkillDefinitionError("skill '" + def.id + "': featureBuilder must be a string");
    }
    def.feature_builder = entry["featureBuilder"].get<std::string>();

    if (entry.contains("triggers")) {
        const auto& triggers = entry["triggers"];
        if (!triggers.is_array()) {
            throw SkillDefinitionError("skill '" + def.id + "': triggers must be an array");
        }
        for (const auto& trigger : triggers) {
            if (!trigger.is_string()) {
                throw SkillDefinitionError("skill '" + def.id + "': triggers must be strings");
            }
            def.triggers.push_back(trigger.get<std::string>());
        }
    }

    if (entry.contains("inputDim")) {
        const auto& dim = entry["inputDim"];
        if (!dim.is_number_integer() || dim.get<long long>() <= 0) {
            throw SkillDefinitionError("skill '" + def.id + "': inputDim must be a positive integer");
        }
        def.input_dim = static_cast<size_t>(dim.get<long long>());
    }
    return def;
}

} // anonymous namespace

std::vector<SkillDefinition> parse_skill_definitions(const std::string& document) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(document);
    } catch (const nlohmann::json::parse_error& e) {
        throw SkillDefinitionError(std::string{"definition is not valid JSON: "} + e.what());
    }

    if (!root.is_object() || !root.contains("skills") || !root["skills"].is_array()) {
        throw SkillDefinitionError("definition must be an object with a \"skills\" array");
    }

    std::vector<SkillDefinition> definitions;
    std::set<std::string> seen;
    const auto& skills = root["skills"];
    for (size_t i = 0; i < skills.size(); ++i) {
        auto def = parse_entry(skills[i], i);
        if (!seen.insert(def.id).second) {
            throw SkillDefinitionError("duplicate skill id '" + def.id + "'");
        }
        definitions.push_back(std::move(def));
    }
    return definitions;
}

std::string read_definition_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw SkillDefinitionError("cannot open skill definition file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace SkillRuntime::Skills
