/**
 * @file inference/InferenceHub.hpp
 * @brief Owner of per-skill inference sessions, the idle switch and connection flags.
 */
#pragma once

#include "InferenceBackend.hpp"
#include "InferenceSession.hpp"
#include "skills/features/FeatureBuilderRegistry.hpp"
#include "skills/registry/SkillRegistry.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

class Logger;

namespace SkillRuntime::Inference {

/**
 * @brief Where the hub reads its skill definitions from.
 *
 * An in-memory document wins over a path. With neither set, init() loads
 * nothing and the registry is used as the caller populated it.
 */
struct DefinitionSource {
    std::string path;
    std::string document;

    [[nodiscard]] static DefinitionSource from_file(std::string p) { return {std::move(p), {}}; }
    [[nodiscard]] static DefinitionSource from_text(std::string d) { return {{}, std::move(d)}; }

    [[nodiscard]] bool empty() const noexcept { return path.empty() && document.empty(); }
};

/**
 * @brief Manages the lifecycle of cached inference sessions.
 *
 * Sessions are created on first use, exactly once per skill id even under
 * concurrent first access, and kept for the hub's lifetime. The hub must be
 * owned by a std::shared_ptr: the runners it hands to the registry refer back
 * to it weakly.
 */
class InferenceHub : public std::enable_shared_from_this<InferenceHub> {
public:
    /**
     * @param registry Registry receiving the loaded skills (must not be null).
     * @param builders Feature builders referenced by definitions (must not be null).
     * @param backend_factory Creates the backend for a skill's session.
     * @param source Skill definitions loaded by init().
     * @param logger Logger for hub events (may be nullptr).
     */
    InferenceHub(
        std::shared_ptr<Skills::SkillRegistry> registry,
        std::shared_ptr<const Features::FeatureBuilderRegistry> builders,
        BackendFactory backend_factory,
        DefinitionSource source = {},
        std::shared_ptr<Logger> logger = nullptr
    );

    InferenceHub(const InferenceHub&) = delete;
    InferenceHub& operator=(const InferenceHub&) = delete;

    /**
     * @brief Load skill definitions into the registry; sessions stay uncreated.
     *
     * Idempotent: only the first successful call loads. A failed load leaves
     * the hub uninitialized so the call can be retried.
     *
     * @return true if this call performed the load.
     * @throws Skills::SkillDefinitionError for a malformed or unreadable document.
     */
    bool init();

    [[nodiscard]] bool is_initialized() const;

    /**
     * @brief Session for @p skill_id, created on first access.
     * @return nullptr if the skill is not registered.
     * @throws std::runtime_error if the backend factory yields no backend;
     *         the next call retries creation.
     */
    [[nodiscard]] std::shared_ptr<InferenceSession> session(const std::string& skill_id);

    /// @brief Runner factory producing hub-backed runners for definition loading.
    [[nodiscard]] Skills::SkillRegistry::RunnerFactory runner_factory();

    // Idle mode
    void set_idle_mode(bool idle);
    [[nodiscard]] bool is_idle() const noexcept;

    // Connection state (independent of sessions and idle mode)
    bool connect(const std::string& key);
    void disconnect(const std::string& key);
    [[nodiscard]] bool is_connected(const std::string& key) const;

    // Statistics
    [[nodiscard]] uint64_t active_inference_count() const noexcept;
    [[nodiscard]] uint64_t skipped_inference_count() const noexcept;
    [[nodiscard]] size_t sessions_created() const noexcept;

    [[nodiscard]] const std::shared_ptr<Skills::SkillRegistry>& registry() const noexcept { return registry_; }

private:
    /// Creation cell for one skill; its mutex serializes first access.
    struct SessionCell {
        std::mutex mutex;
        std::shared_ptr<InferenceSession> session;
    };

    void log_debug(const std::string& message) const;

    std::shared_ptr<Skills::SkillRegistry> registry_;
    std::shared_ptr<const Features::FeatureBuilderRegistry> builders_;
    BackendFactory backend_factory_;
    DefinitionSource source_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex init_mutex_;
    bool initialized_{false};

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionCell>> sessions_;
    std::atomic<size_t> sessions_created_{0};

    std::shared_ptr<InferenceCounters> counters_;

    mutable std::mutex connections_mutex_;
    std::set<std::string> connections_;
};

/**
 * @brief Runner that executes a skill through its hub session.
 */
class InferenceHubRunner : public Skills::VectorRunner {
public:
    InferenceHubRunner(std::weak_ptr<InferenceHub> hub, std::string skill_id);

    /// @throws std::runtime_error if the hub is gone or has no session for the skill.
    [[nodiscard]] FeatureVector run_skill(const FeatureVector& features) override;

private:
    std::weak_ptr<InferenceHub> hub_;
    std::string skill_id_;
};

} // namespace SkillRuntime::Inference
