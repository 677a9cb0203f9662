/**
 * @file skills/registry/SkillRegistry.hpp
 * @brief Central registry for skills: registrations, trigger index, and bootstrap.
 */
#pragma once

#include "SkillDefinition.hpp"
#include "SkillDescriptor.hpp"
#include "SkillRegistration.hpp"
#include "skills/features/FeatureBuilderRegistry.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

class Logger;

namespace SkillRuntime::Skills {

/**
 * @brief Central registry mapping skill ids and trigger phrases to registrations.
 *
 * Thread-safe. Registrations are immutable and held by shared_ptr, so a reader
 * either sees the previous registration or the complete new one, never a
 * partially inserted entry.
 *
 * Re-registration policy: registering an existing id overwrites it. The old
 * registration's triggers are dropped and the new ones indexed in the same
 * critical section. The replaced skill keeps its original registration order
 * for trigger tie-breaking.
 *
 * Ambiguous triggers (several skills share a phrase) resolve to the skill that
 * was registered first.
 */
class SkillRegistry {
public:
    /// Produces the runner for a skill loaded from a definition document.
    using RunnerFactory = std::function<std::shared_ptr<VectorRunner>(const std::string& skill_id)>;

    /**
     * @brief Construct a SkillRegistry with optional logger.
     * @param logger Logger for debug output (may be nullptr).
     */
    explicit SkillRegistry(std::shared_ptr<Logger> logger = nullptr);

    // Non-copyable, non-movable
    SkillRegistry(const SkillRegistry&) = delete;
    SkillRegistry& operator=(const SkillRegistry&) = delete;
    SkillRegistry(SkillRegistry&&) = delete;
    SkillRegistry& operator=(SkillRegistry&&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /**
     * @brief Register (or replace) a skill.
     * @param id Skill identifier.
     * @param descriptor Descriptor owning the runner (must not be null).
     * @param triggers Trigger phrases; normalized before indexing.
     * @throws std::invalid_argument for an empty id, a null descriptor, or a
     *         descriptor whose runner() is null.
     */
    template<typename PayloadT, typename Features, typename Output>
    void register_skill(
        const std::string& id,
        std::shared_ptr<ISkillDescriptor<PayloadT, Features, Output>> descriptor,
        const std::vector<std::string>& triggers = {}
    ) {
        if (id.empty()) {
            throw std::invalid_argument("skill id must not be empty");
        }
        if (!descriptor) {
            throw std::invalid_argument("cannot register skill '" + id + "' without a descriptor");
        }
        if (!descriptor->runner()) {
            throw std::invalid_argument("cannot register skill '" + id + "': descriptor has no runner");
        }
        insert({std::make_shared<const SkillRegistration<PayloadT, Features, Output>>(
            id, std::move(descriptor), normalize_triggers(triggers))});
    }

    /**
     * @brief Remove a skill and its trigger entries.
     * @return true if the skill was registered.
     */
    bool unregister_skill(const std::string& id);

    /**
     * @brief Load every skill of a definition document.
     *
     * Each skill gets a FeatureBuilderDescriptor over the named builder and
     * the runner produced by @p runner_factory. The load is atomic: the
     * document is fully parsed and every builder and runner resolved before
     * the first registration is inserted.
     *
     * @throws SkillDefinitionError for malformed documents, unknown builders,
     *         or a factory returning no runner. The registry is unchanged.
     * @return Number of skills registered.
     */
    size_t initialize_from_definition(
        const std::string& document,
        const Features::FeatureBuilderRegistry& builders,
        const RunnerFactory& runner_factory
    );

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] bool is_registered(const std::string& id) const;

    /**
     * @brief Typed registration lookup.
     * @return The registration, or nullptr if the id is unknown or was
     *         registered with a different (Payload, Features, Output) triple.
     */
    template<typename PayloadT, typename Features, typename Output>
    [[nodiscard]] std::shared_ptr<const SkillRegistration<PayloadT, Features, Output>>
    get_registration(const std::string& id) const {
        return std::dynamic_pointer_cast<const SkillRegistration<PayloadT, Features, Output>>(find(id));
    }

    /// @brief Typed descriptor lookup (nullptr if absent or mismatched).
    template<typename PayloadT, typename Features, typename Output>
    [[nodiscard]] std::shared_ptr<ISkillDescriptor<PayloadT, Features, Output>>
    get_skill(const std::string& id) const {
        auto registration = get_registration<PayloadT, Features, Output>(id);
        return registration ? registration->descriptor() : nullptr;
    }

    /// @brief Descriptor reached by a trigger phrase (nullptr if none or mismatched).
    template<typename PayloadT, typename Features, typename Output>
    [[nodiscard]] std::shared_ptr<ISkillDescriptor<PayloadT, Features, Output>>
    get_skill_by_trigger(const std::string& trigger) const {
        auto id = resolve_trigger(trigger);
        return id ? get_skill<PayloadT, Features, Output>(*id) : nullptr;
    }

    /// @brief Untyped registration lookup.
    [[nodiscard]] std::shared_ptr<const SkillRegistrationBase> find(const std::string& id) const;

    /// @brief All skill ids reachable by @p trigger (normalized first).
    [[nodiscard]] std::set<std::string> find_skill_ids_for_trigger(const std::string& trigger) const;

    /// @brief The single skill id a trigger resolves to (first registered wins).
    [[nodiscard]] std::optional<std::string> resolve_trigger(const std::string& trigger) const;

    [[nodiscard]] std::set<std::string> list_skills() const;
    [[nodiscard]] std::set<std::string> list_triggers() const;
    [[nodiscard]] size_t skill_count() const;

    // =========================================================================
    // Testing / Reset
    // =========================================================================

    /**
     * @brief Clear all registered skills (primarily for testing).
     */
    void clear();

    /// @brief Lowercase and trim a trigger phrase.
    [[nodiscard]] static std::string normalize_trigger(const std::string& trigger);

private:
    struct Entry {
        std::shared_ptr<const SkillRegistrationBase> registration;
        uint64_t sequence{0};
    };

    static std::vector<std::string> normalize_triggers(const std::vector<std::string>& triggers);

    /// Insert a batch of registrations in one critical section.
    void insert(std::vector<std::shared_ptr<const SkillRegistrationBase>> registrations);
    void erase_triggers_locked(const SkillRegistrationBase& registration);

    void log_debug(const std::string& message) const;

    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> skills_;
    std::map<std::string, std::set<std::string>> trigger_index_;
    uint64_t next_sequence_{0};
};

} // namespace SkillRuntime::Skills
