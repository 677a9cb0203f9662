/**
 * @file skills/features/FeatureBuilder.hpp
 * @brief Interface for domain feature builders.
 */
#pragma once

#include "FeatureSignals.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace SkillRuntime::Features {

/**
 * @brief Raised when a builder breaks the fixed-width contract.
 *
 * This is an invariant violation, not a payload problem: payload fields are
 * read tolerantly and never cause a throw.
 */
class FeatureInvariantError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Maps a payload to a fixed-length feature vector for one skill domain.
 *
 * Implementations are pure and deterministic: the same payload and dimension
 * always produce the same vector.
 */
class IFeatureBuilder {
public:
    virtual ~IFeatureBuilder() = default;

    /// @brief Registry name of this builder (e.g., "education").
    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    /**
     * @brief Build a vector of exactly @p dim elements.
     * @throws std::invalid_argument if @p dim is 0.
     */
    [[nodiscard]] virtual FeatureVector build(const Payload& payload, std::size_t dim) const = 0;
};

/**
 * @brief Builder defined by an ordered signal-extraction function.
 *
 * The extractor produces the domain's signal list; the base class fits it to
 * the requested width with compose_vector().
 */
class SignalFeatureBuilder : public IFeatureBuilder {
public:
    using Extractor = std::vector<float> (*)(const Payload&);

    SignalFeatureBuilder(std::string name, Extractor extractor)
        : name_(std::move(name))
        , extractor_(extractor) {}

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    [[nodiscard]] FeatureVector build(const Payload& payload, std::size_t dim) const override {
        return compose_vector(extractor_(payload), dim);
    }

private:
    std::string name_;
    Extractor extractor_;
};

/// @brief The twelve built-in domain builders, in a fixed order.
[[nodiscard]] std::vector<std::shared_ptr<const IFeatureBuilder>> make_domain_builders();

} // namespace SkillRuntime::Features
