/**
 * @file inference/InferenceHub.cpp
 * @brief Implementation of the InferenceHub and its runner.
 */
#include "InferenceHub.hpp"
#include "logger.hpp"

#include <stdexcept>

namespace SkillRuntime::Inference {

InferenceHub::InferenceHub(
    std::shared_ptr<Skills::SkillRegistry> registry,
    std::shared_ptr<const Features::FeatureBuilderRegistry> builders,
    BackendFactory backend_factory,
    DefinitionSource source,
    std::shared_ptr<Logger> logger
)
    : registry_(std::move(registry))
    , builders_(std::move(builders))
    , backend_factory_(std::move(backend_factory))
    , source_(std::move(source))
    , logger_(std::move(logger))
    , counters_(std::make_shared<InferenceCounters>())
{
    if (!registry_) {
        throw std::invalid_argument("InferenceHub: registry cannot be null");
    }
    if (!builders_) {
        throw std::invalid_argument("InferenceHub: feature builders cannot be null");
    }
    if (!backend_factory_) {
        throw std::invalid_argument("InferenceHub: backend factory cannot be null");
    }
}

bool InferenceHub::init() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (initialized_) {
        return false;
    }

    if (!source_.empty()) {
        const std::string document = source_.document.empty()
            ? Skills::read_definition_file(source_.path)
            : source_.document;
        auto loaded = registry_->initialize_from_definition(document, *builders_, runner_factory());
        log_debug("Loaded " + std::to_string(loaded) + " skills" +
                  (source_.document.empty() ? " from " + source_.path : std::string{}));
    }

    initialized_ = true;
    log_debug("Initialized");
    return true;
}

bool InferenceHub::is_initialized() const {
    std::lock_guard<std::mutex> lock(init_mutex_);
    return initialized_;
}

Skills::SkillRegistry::RunnerFactory InferenceHub::runner_factory() {
    std::weak_ptr<InferenceHub> self = weak_from_this();
    if (self.expired()) {
        throw std::logic_error("InferenceHub must be owned by a std::shared_ptr");
    }
    return [self](const std::string& skill_id) -> std::shared_ptr<Skills::VectorRunner> {
        return std::make_shared<InferenceHubRunner>(self, skill_id);
    };
}

std::shared_ptr<InferenceSession> InferenceHub::session(const std::string& skill_id) {
    if (!registry_->is_registered(skill_id)) {
        return nullptr;
    }

    std::shared_ptr<SessionCell> cell;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto& slot = sessions_[skill_id];
        if (!slot) {
            slot = std::make_shared<SessionCell>();
        }
        cell = slot;
    }

    // Creation runs outside the map lock; concurrent callers for the same id
    // wait on the cell until the first one has stored the session.
    std::lock_guard<std::mutex> cell_lock(cell->mutex);
    if (!cell->session) {
        auto backend = backend_factory_(skill_id);
        if (!backend) {
            throw std::runtime_error("no inference backend for skill " + skill_id);
        }
        cell->session = std::make_shared<InferenceSession>(skill_id, std::move(backend), counters_);
        sessions_created_.fetch_add(1, std::memory_order_relaxed);
        log_debug("Created session for skill=" + skill_id);
    }
    return cell->session;
}

void InferenceHub::set_idle_mode(bool idle) {
    counters_->idle.store(idle, std::memory_order_release);
    log_debug(idle ? "Idle mode on" : "Idle mode off");
}

bool InferenceHub::is_idle() const noexcept {
    return counters_->idle.load(std::memory_order_acquire);
}

bool InferenceHub::connect(const std::string& key) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.insert(key);
    return true;
}

void InferenceHub::disconnect(const std::string& key) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(key);
}

bool InferenceHub::is_connected(const std::string& key) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.count(key) > 0;
}

uint64_t InferenceHub::active_inference_count() const noexcept {
    return counters_->active.load(std::memory_order_relaxed);
}

uint64_t InferenceHub::skipped_inference_count() const noexcept {
    return counters_->skipped.load(std::memory_order_relaxed);
}

size_t InferenceHub::sessions_created() const noexcept {
    return sessions_created_.load(std::memory_order_relaxed);
}

void InferenceHub::log_debug(const std::string& message) const {
    if (logger_) {
        logger_->debug("[InferenceHub] " + message);
    }
}

// =========================================================================
// InferenceHubRunner
// =========================================================================

InferenceHubRunner::InferenceHubRunner(std::weak_ptr<InferenceHub> hub, std::string skill_id)
    : hub_(std::move(hub))
    , skill_id_(std::move(skill_id))
{
}

FeatureVector InferenceHubRunner::run_skill(const FeatureVector& features) {
    auto hub = hub_.lock();
    if (!hub) {
        throw std::runtime_error("inference hub released before running " + skill_id_);
    }
    auto session = hub->session(skill_id_);
    if (!session) {
        throw std::runtime_error("no inference session for skill " + skill_id_);
    }
    return session->run(features);
}

} // namespace SkillRuntime::Inference
