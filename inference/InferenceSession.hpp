/**
 * @file inference/InferenceSession.hpp
 * @brief Cached backend instance for one skill, honoring the hub's idle switch.
 */
#pragma once

#include "InferenceBackend.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace SkillRuntime::Inference {

/**
 * @brief State shared by a hub and every session it created.
 */
struct InferenceCounters {
    std::atomic<bool> idle{false};
    std::atomic<uint64_t> active{0};   // runs that reached a backend
    std::atomic<uint64_t> skipped{0};  // runs short-circuited by idle mode
};

/**
 * @brief Wraps one backend for one skill id.
 *
 * run() reads the idle flag on every call. While idle the backend is never
 * touched and a zero vector of the backend's output width is returned.
 * A backend exception propagates to the caller and leaves the session usable.
 */
class InferenceSession {
public:
    InferenceSession(
        std::string skill_id,
        std::unique_ptr<IInferenceBackend> backend,
        std::shared_ptr<InferenceCounters> counters
    );

    InferenceSession(const InferenceSession&) = delete;
    InferenceSession& operator=(const InferenceSession&) = delete;

    [[nodiscard]] FeatureVector run(const FeatureVector& features);

    [[nodiscard]] const std::string& skill_id() const noexcept { return skill_id_; }

private:
    std::string skill_id_;
    std::unique_ptr<IInferenceBackend> backend_;
    std::shared_ptr<InferenceCounters> counters_;
};

} // namespace SkillRuntime::Inference
