/**
 * @file skills/registry/SkillRegistry.cpp
 * @brief Implementation of the trigger-aware SkillRegistry.
 */
#include "SkillRegistry.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>

namespace SkillRuntime::Skills {

SkillRegistry::SkillRegistry(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
{
}

std::string SkillRegistry::normalize_trigger(const std::string& trigger) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(trigger.begin(), trigger.end(), is_space);
    auto end = std::find_if_not(trigger.rbegin(), trigger.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    std::string result(begin, end);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> SkillRegistry::normalize_triggers(const std::vector<std::string>& triggers) {
    std::vector<std::string> result;
    result.reserve(triggers.size());
    for (const auto& trigger : triggers) {
        auto normalized = normalize_trigger(trigger);
        if (normalized.empty()) {
            continue;
        }
        if (std::find(result.begin(), result.end(), normalized) == result.end()) {
            result.push_back(std::move(normalized));
        }
    }
    return result;
}

void SkillRegistry::insert(std::vector<std::shared_ptr<const SkillRegistrationBase>> registrations) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& registration : registrations) {
        const std::string id = registration->id();
        auto it = skills_.find(id);
        if (it != skills_.end()) {
            erase_triggers_locked(*it->second.registration);
            it->second.registration = registration;
            log_debug("Replaced skill=" + id);
        } else {
            skills_.emplace(id, Entry{registration, next_sequence_++});
            log_debug("Registered skill=" + id);
        }
        for (const auto& trigger : registration->triggers()) {
            trigger_index_[trigger].insert(id);
        }
    }
}

void SkillRegistry::erase_triggers_locked(const SkillRegistrationBase& registration) {
    for (const auto& trigger : registration.triggers()) {
        auto it = trigger_index_.find(trigger);
        if (it == trigger_index_.end()) {
            continue;
        }
        it->second.erase(registration.id());
        if (it->second.empty()) {
            trigger_index_.erase(it);
        }
    }
}

bool SkillRegistry::unregister_skill(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = skills_.find(id);
    if (it == skills_.end()) {
        return false;
    }
    erase_triggers_locked(*it->second.registration);
    skills_.erase(it);
    log_debug("Unregistered skill=" + id);
    return true;
}

size_t SkillRegistry::initialize_from_definition(
    const std::string& document,
    const Features::FeatureBuilderRegistry& builders,
    const RunnerFactory& runner_factory
) {
    auto definitions = parse_skill_definitions(document);

    // Resolve everything before touching the registry
    std::vector<std::shared_ptr<const SkillRegistrationBase>> registrations;
    registrations.reserve(definitions.size());
    for (const auto& def : definitions) {
        auto builder = builders.find(def.feature_builder);
        if (!builder) {
            throw SkillDefinitionError(
                "skill '" + def.id + "': unknown featureBuilder '" + def.feature_builder + "'");
        }
        auto runner = runner_factory ? runner_factory(def.id) : nullptr;
        if (!runner) {
            throw SkillDefinitionError("skill '" + def.id + "': no runner available");
        }
        std::shared_ptr<VectorSkill> descriptor =
            std::make_shared<FeatureBuilderDescriptor>(builder, std::move(runner), def.input_dim);
        registrations.push_back(std::make_shared<const SkillRegistration<Payload, FeatureVector, FeatureVector>>(
            def.id, std::move(descriptor), normalize_triggers(def.triggers)));
    }

    insert(std::move(registrations));
    log_debug("Loaded " + std::to_string(definitions.size()) + " skill definitions");
    return definitions.size();
}

bool SkillRegistry::is_registered(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return skills_.find(id) != skills_.end();
}

std::shared_ptr<const SkillRegistrationBase> SkillRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = skills_.find(id);
    if (it == skills_.end()) {
        return nullptr;
    }
    return it->second.registration;
}

std::set<std::string> SkillRegistry::find_skill_ids_for_trigger(const std::string& trigger) const {
    auto key = normalize_trigger(trigger);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trigger_index_.find(key);
    if (it == trigger_index_.end()) {
        return {};
    }
    return it->second;
}

std::optional<std::string> SkillRegistry::resolve_trigger(const std::string& trigger) const {
    auto key = normalize_trigger(trigger);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trigger_index_.find(key);
    if (it == trigger_index_.end()) {
        return std::nullopt;
    }

    std::optional<std::string> best;
    uint64_t best_sequence = 0;
    for (const auto& id : it->second) {
        auto skill = skills_.find(id);
        if (skill == skills_.end()) {
            continue;
        }
        if (!best || skill->second.sequence < best_sequence) {
            best = id;
            best_sequence = skill->second.sequence;
        }
    }
    if (it->second.size() > 1 && best) {
        log_debug("Trigger '" + key + "' is ambiguous, resolved to " + *best);
    }
    return best;
}

std::set<std::string> SkillRegistry::list_skills() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> result;
    for (const auto& [id, entry] : skills_) {
        result.insert(id);
    }
    return result;
}

std::set<std::string> SkillRegistry::list_triggers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> result;
    for (const auto& [trigger, ids] : trigger_index_) {
        result.insert(trigger);
    }
    return result;
}

size_t SkillRegistry::skill_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return skills_.size();
}

void SkillRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    skills_.clear();
    trigger_index_.clear();
    next_sequence_ = 0;
}

void SkillRegistry::log_debug(const std::string& message) const {
    if (logger_) {
        logger_->debug("[SkillRegistry] " + message);
    }
}

} // namespace SkillRuntime::Skills
