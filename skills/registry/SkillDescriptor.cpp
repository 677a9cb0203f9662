/**
 * @file skills/registry/SkillDescriptor.cpp
 * @brief Builder-backed and text-pipeline descriptors.
 */
#include "SkillDescriptor.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace SkillRuntime::Skills {

FeatureBuilderDescriptor::FeatureBuilderDescriptor(
    std::shared_ptr<const Features::IFeatureBuilder> builder,
    std::shared_ptr<VectorRunner> runner,
    std::size_t input_dim
)
    : SkillDescriptorBase(std::move(runner))
    , builder_(std::move(builder))
    , input_dim_(input_dim)
{
    if (!builder_) {
        throw std::invalid_argument("feature builder descriptor requires a builder");
    }
    if (input_dim_ == 0) {
        throw std::invalid_argument("feature dimension must be positive");
    }
}

FeatureVector FeatureBuilderDescriptor::build_features(const Payload& payload) const {
    auto features = builder_->build(payload, input_dim_);
    if (features.size() != input_dim_) {
        throw Features::FeatureInvariantError(
            "builder '" + builder_->name() + "' returned " + std::to_string(features.size()) +
            " features, expected " + std::to_string(input_dim_));
    }
    return features;
}

TextPipelineDescriptor::TextPipelineDescriptor(
    std::shared_ptr<VectorRunner> runner,
    std::size_t input_dim
)
    : SkillDescriptorBase(std::move(runner))
    , input_dim_(input_dim)
{
    if (input_dim_ < 2) {
        throw std::invalid_argument("text pipeline needs at least two feature slots");
    }
}

FeatureVector TextPipelineDescriptor::build_features(const std::string& text) const {
    FeatureVector features(input_dim_, 0.0f);
    std::size_t token_count = 0;
    std::uint32_t hash = 2166136261u;
    bool in_token = false;

    auto flush = [&]() {
        if (!in_token) {
            return;
        }
        auto slot = 1 + (hash % static_cast<std::uint32_t>(input_dim_ - 1));
        features[slot] += 1.0f;
        ++token_count;
        hash = 2166136261u;
        in_token = false;
    };

    for (unsigned char c : text) {
        // Bytes >= 0x80 belong to UTF-8 sequences and stay inside tokens.
        if (std::isalnum(c) || c >= 0x80) {
            hash ^= static_cast<std::uint32_t>(std::tolower(c));
            hash *= 16777619u;
            in_token = true;
        } else {
            flush();
        }
    }
    flush();

    if (token_count == 0) {
        return features;
    }
    float peak = *std::max_element(features.begin() + 1, features.end());
    for (auto it = features.begin() + 1; it != features.end(); ++it) {
        *it /= peak;
    }
    features[0] = Features::normalized_count(static_cast<double>(token_count), 64.0);
    return features;
}

} // namespace SkillRuntime::Skills
