/**
 * @file skills/features/FeatureBuilderRegistry.hpp
 * @brief Name -> feature builder lookup used by skill-definition loading.
 */
#pragma once

#include "FeatureBuilder.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace SkillRuntime::Features {

/**
 * @brief Thread-safe registry of feature builders keyed by name.
 *
 * Constructed by the composition root and populated once at startup; skill
 * definitions refer to builders by name ("featureBuilder": "education").
 */
class FeatureBuilderRegistry {
public:
    FeatureBuilderRegistry() = default;

    // Non-copyable, non-movable
    FeatureBuilderRegistry(const FeatureBuilderRegistry&) = delete;
    FeatureBuilderRegistry& operator=(const FeatureBuilderRegistry&) = delete;

    /// @brief Registry holding the twelve built-in domain builders.
    [[nodiscard]] static std::shared_ptr<FeatureBuilderRegistry> with_builtin_builders();

    /**
     * @brief Add a builder under its own name.
     * @note A builder with the same name is replaced.
     */
    void add(std::shared_ptr<const IFeatureBuilder> builder);

    /// @brief Builder for @p name, or nullptr if unknown.
    [[nodiscard]] std::shared_ptr<const IFeatureBuilder> find(const std::string& name) const;

    /// @brief Names of all builders, in insertion order.
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const IFeatureBuilder>> builders_;
    std::vector<std::string> order_;
};

} // namespace SkillRuntime::Features
