/**
 * @file inference/InferenceSession.cpp
 */
#include "InferenceSession.hpp"

#include <stdexcept>

namespace SkillRuntime::Inference {

InferenceSession::InferenceSession(
    std::string skill_id,
    std::unique_ptr<IInferenceBackend> backend,
    std::shared_ptr<InferenceCounters> counters
)
    : skill_id_(std::move(skill_id))
    , backend_(std::move(backend))
    , counters_(std::move(counters))
{
    if (!backend_) {
        throw std::invalid_argument("InferenceSession: no backend for skill " + skill_id_);
    }
    if (!counters_) {
        throw std::invalid_argument("InferenceSession: counters cannot be null");
    }
}

FeatureVector InferenceSession::run(const FeatureVector& features) {
    if (counters_->idle.load(std::memory_order_acquire)) {
        counters_->skipped.fetch_add(1, std::memory_order_relaxed);
        return FeatureVector(backend_->output_size(features.size()), 0.0f);
    }
    counters_->active.fetch_add(1, std::memory_order_relaxed);
    return backend_->infer(features);
}

} // namespace SkillRuntime::Inference
