/**
 * \file runtime/Runtime.hpp
 * \brief Composition root owning every runtime component.
 */
#pragma once

#include "RuntimeOptions.hpp"
#include "decision/DecisionEngine.hpp"
#include "decision/SigmaGateTable.hpp"
#include "inference/InferenceHub.hpp"
#include "postprocess/PostProcessors.hpp"
#include "router/Router.hpp"
#include "skills/features/FeatureBuilderRegistry.hpp"
#include "skills/registry/SkillRegistry.hpp"
#include "telemetry/TelemetrySink.hpp"
#include "updates/ManifestVerifier.hpp"
#include "updates/SkillUpdateInstaller.hpp"

#include <memory>

class Logger;

namespace SkillRuntime {

/**
 * \brief Builds and wires the runtime from a RuntimeConfig.
 *
 * Construction creates components only; start() initializes the hub (loading
 * skill definitions) and applies the configured idle mode. Components are
 * handed out as shared pointers so collaborators can outlive a call, but there
 * is no global instance.
 */
class Runtime {
public:
    /**
     * \throws std::invalid_argument for invalid sampling rates, sigma gates,
     *         backend name or public key.
     */
    Runtime(RuntimeConfig config, std::shared_ptr<Logger> logger);

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    /// \throws Skills::SkillDefinitionError if the definitions cannot be loaded.
    void start();

    const RuntimeConfig& config() const { return config_; }

    const std::shared_ptr<Features::FeatureBuilderRegistry>& builders() const { return builders_; }
    const std::shared_ptr<Skills::SkillRegistry>& registry() const { return registry_; }
    const std::shared_ptr<Telemetry::TelemetrySink>& telemetry() const { return telemetry_; }
    const std::shared_ptr<Inference::InferenceHub>& hub() const { return hub_; }
    const std::shared_ptr<Routing::Router>& router() const { return router_; }
    const std::shared_ptr<Decision::SigmaGateTable>& sigma_gates() const { return sigma_gates_; }
    const Decision::DecisionEngine& decisions() const { return decisions_; }
    const PostProcess::PostProcessorTable& post_processors() const { return post_processors_; }

    /// Manifest verifier, or nullptr when no release key is configured.
    const std::shared_ptr<Updates::ManifestVerifier>& verifier() const { return verifier_; }
    /// Update installer, or nullptr when no release key is configured.
    const std::shared_ptr<Updates::SkillUpdateInstaller>& installer() const { return installer_; }

private:
    RuntimeConfig config_;
    std::shared_ptr<Logger> logger_;

    std::shared_ptr<Features::FeatureBuilderRegistry> builders_;
    std::shared_ptr<Skills::SkillRegistry> registry_;
    std::shared_ptr<Telemetry::TelemetrySink> telemetry_;
    std::shared_ptr<Inference::InferenceHub> hub_;
    std::shared_ptr<Routing::Router> router_;
    std::shared_ptr<Decision::SigmaGateTable> sigma_gates_;
    Decision::DecisionEngine decisions_;
    PostProcess::PostProcessorTable post_processors_;
    std::shared_ptr<Updates::ManifestVerifier> verifier_;
    std::shared_ptr<Updates::SkillUpdateInstaller> installer_;
};

} // namespace SkillRuntime
