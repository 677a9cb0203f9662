/**
 * @file inference/InferenceBackend.hpp
 * @brief Local inference backend interface and the built-in deterministic backends.
 */
#pragma once

#include "skills/payload/Payload.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace SkillRuntime::Inference {

using Skills::FeatureVector;

/**
 * @brief One loaded model for one skill.
 *
 * infer() may block for the duration of a forward pass and may throw; the
 * owning InferenceSession does not catch.
 */
class IInferenceBackend {
public:
    virtual ~IInferenceBackend() = default;

    [[nodiscard]] virtual FeatureVector infer(const FeatureVector& features) = 0;

    /// @brief Output width for an input of @p input_size elements.
    [[nodiscard]] virtual std::size_t output_size(std::size_t input_size) const { return input_size; }
};

/// @brief Produces the backend for a skill id.
using BackendFactory = std::function<std::unique_ptr<IInferenceBackend>(const std::string& skill_id)>;

/// @brief Returns the features unchanged (stand-in for an unconfigured model).
class EchoBackend : public IInferenceBackend {
public:
    [[nodiscard]] FeatureVector infer(const FeatureVector& features) override { return features; }
};

/**
 * @brief Deterministic mock: adds (model_name.length() % 7) + 1 to every element.
 */
class OffsetBackend : public IInferenceBackend {
public:
    explicit OffsetBackend(const std::string& model_name);

    [[nodiscard]] FeatureVector infer(const FeatureVector& features) override;

    [[nodiscard]] float offset() const noexcept { return offset_; }

private:
    float offset_;
};

/// @brief Factory name -> BackendFactory ("echo", "offset"); nullptr if unknown.
[[nodiscard]] BackendFactory backend_factory_by_name(const std::string& name);

} // namespace SkillRuntime::Inference
