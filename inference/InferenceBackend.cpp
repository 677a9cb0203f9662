/**
 * @file inference/InferenceBackend.cpp
 * @brief Built-in backends.
 */
#include "InferenceBackend.hpp"

namespace SkillRuntime::Inference {

OffsetBackend::OffsetBackend(const std::string& model_name)
    : offset_(static_cast<float>(model_name.length() % 7 + 1))
{
}

FeatureVector OffsetBackend::infer(const FeatureVector& features) {
    FeatureVector output(features.size());
    for (std::size_t i = 0; i < features.size(); ++i) {
        output[i] = features[i] + offset_;
    }
    return output;
}

BackendFactory backend_factory_by_name(const std::string& name) {
    if (name == "echo") {
        return [](const std::string&) { return std::make_unique<EchoBackend>(); };
    }
    if (name == "offset") {
        return [](const std::string& skill_id) { return std::make_unique<OffsetBackend>(skill_id); };
    }
    return nullptr;
}

} // namespace SkillRuntime::Inference
