/**
 * @file skills/features/FeatureBuilderRegistry.cpp
 * @brief Implementation of FeatureBuilderRegistry.
 */
#include "FeatureBuilderRegistry.hpp"

namespace SkillRuntime::Features {

std::shared_ptr<FeatureBuilderRegistry> FeatureBuilderRegistry::with_builtin_builders() {
    auto registry = std::make_shared<FeatureBuilderRegistry>();
    for (auto& builder : make_domain_builders()) {
        registry->add(std::move(builder));
    }
    return registry;
}

void FeatureBuilderRegistry::add(std::shared_ptr<const IFeatureBuilder> builder) {
    if (!builder) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& name = builder->name();
    if (builders_.find(name) == builders_.end()) {
        order_.push_back(name);
    }
    builders_[name] = std::move(builder);
}

std::shared_ptr<const IFeatureBuilder> FeatureBuilderRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = builders_.find(name);
    if (it != builders_.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<std::string> FeatureBuilderRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

size_t FeatureBuilderRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return builders_.size();
}

} // namespace SkillRuntime::Features
