/**
 * @file skills/registry/SkillDescriptor.hpp
 * @brief Skill capability interfaces: feature building plus an owned runner.
 */
#pragma once

#include "skills/features/FeatureBuilder.hpp"
#include "skills/payload/Payload.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace SkillRuntime::Skills {

/**
 * @brief Execution strategy of a skill.
 *
 * @tparam Features Input produced by the descriptor's feature builder.
 * @tparam Output   Result of running the skill.
 *
 * run_skill() may block (e.g., a model forward pass). Exceptions propagate
 * to the caller; the Router converts them into failures.
 */
template<typename Features, typename Output>
class ISkillRunner {
public:
    virtual ~ISkillRunner() = default;

    [[nodiscard]] virtual Output run_skill(const Features& features) = 0;
};

/**
 * @brief Skill capability over a (Payload, Features, Output) triple.
 *
 * Builds features from a payload and owns the runner that consumes them.
 */
template<typename PayloadT, typename Features, typename Output>
class ISkillDescriptor {
public:
    using PayloadType = PayloadT;
    using FeaturesType = Features;
    using OutputType = Output;
    using Runner = ISkillRunner<Features, Output>;

    virtual ~ISkillDescriptor() = default;

    /// @brief Transform a payload into the runner's input.
    [[nodiscard]] virtual Features build_features(const PayloadT& payload) const = 0;

    /// @brief Runner executing this skill (never null).
    [[nodiscard]] virtual std::shared_ptr<Runner> runner() const = 0;
};

/**
 * @brief Convenience base storing the runner.
 */
template<typename PayloadT, typename Features, typename Output>
class SkillDescriptorBase : public ISkillDescriptor<PayloadT, Features, Output> {
public:
    using Runner = ISkillRunner<Features, Output>;

    explicit SkillDescriptorBase(std::shared_ptr<Runner> runner)
        : runner_(std::move(runner)) {
        if (!runner_) {
            throw std::invalid_argument("skill descriptor requires a runner");
        }
    }

    [[nodiscard]] std::shared_ptr<Runner> runner() const override { return runner_; }

private:
    std::shared_ptr<Runner> runner_;
};

// =========================================================================
// Runners
// =========================================================================

/// @brief Returns its input unchanged.
template<typename T>
class EchoRunner : public ISkillRunner<T, T> {
public:
    [[nodiscard]] T run_skill(const T& features) override { return features; }
};

/// @brief Runner backed by an arbitrary callable (mocks, adapters).
template<typename Features, typename Output>
class FunctionRunner : public ISkillRunner<Features, Output> {
public:
    using Function = std::function<Output(const Features&)>;

    explicit FunctionRunner(Function fn) : fn_(std::move(fn)) {}

    [[nodiscard]] Output run_skill(const Features& features) override { return fn_(features); }

private:
    Function fn_;
};

// =========================================================================
// Descriptors
// =========================================================================

/// @brief Uses the payload itself as the feature input (tests, pre-built vectors).
template<typename T, typename Output>
class PassThroughDescriptor : public SkillDescriptorBase<T, T, Output> {
public:
    using SkillDescriptorBase<T, T, Output>::SkillDescriptorBase;

    [[nodiscard]] T build_features(const T& payload) const override { return payload; }
};

/// @brief The common payload-map -> vector -> vector skill shape.
using VectorSkill = ISkillDescriptor<Payload, FeatureVector, FeatureVector>;
using VectorRunner = ISkillRunner<FeatureVector, FeatureVector>;

/**
 * @brief Descriptor delegating feature building to a named domain builder.
 */
class FeatureBuilderDescriptor : public SkillDescriptorBase<Payload, FeatureVector, FeatureVector> {
public:
    /**
     * @param builder Domain feature builder (must not be null).
     * @param runner Runner consuming the vectors.
     * @param input_dim Width requested from the builder.
     */
    FeatureBuilderDescriptor(
        std::shared_ptr<const Features::IFeatureBuilder> builder,
        std::shared_ptr<VectorRunner> runner,
        std::size_t input_dim = Features::DEFAULT_FEATURE_INPUT_DIM
    );

    /// @throws Features::FeatureInvariantError if the builder breaks the width contract.
    [[nodiscard]] FeatureVector build_features(const Payload& payload) const override;

    [[nodiscard]] const std::string& builder_name() const noexcept { return builder_->name(); }
    [[nodiscard]] std::size_t input_dim() const noexcept { return input_dim_; }

private:
    std::shared_ptr<const Features::IFeatureBuilder> builder_;
    std::size_t input_dim_;
};

/**
 * @brief Text skill: hashes lowercase word tokens into a fixed-width bag of tokens.
 *
 * Slot 0 carries the normalized token count; every token increments the slot
 * chosen by its FNV-1a hash. The vector is scaled so its largest element is 1.
 */
class TextPipelineDescriptor : public SkillDescriptorBase<std::string, FeatureVector, FeatureVector> {
public:
    TextPipelineDescriptor(
        std::shared_ptr<VectorRunner> runner,
        std::size_t input_dim = Features::DEFAULT_FEATURE_INPUT_DIM
    );

    [[nodiscard]] FeatureVector build_features(const std::string& text) const override;

private:
    std::size_t input_dim_;
};

} // namespace SkillRuntime::Skills
