/**
 * \file runtime/Runtime.cpp
 * \brief Runtime wiring.
 */
#include "Runtime.hpp"
#include "logger.hpp"

#include <stdexcept>

namespace SkillRuntime {
namespace {

std::shared_ptr<Decision::SigmaGateTable> make_sigma_gates(const RuntimeConfig& config) {
    auto gates = std::make_shared<Decision::SigmaGateTable>();
    for (const auto& [skill_id, gate] : config.sigma_gates) {
        gates->set_gate(skill_id, gate);
    }
    return gates;
}

Inference::DefinitionSource definition_source(const RuntimeConfig& config) {
    if (!config.skills_document.empty()) {
        return Inference::DefinitionSource::from_text(config.skills_document);
    }
    return Inference::DefinitionSource::from_file(config.skills_path.string());
}

} // anonymous namespace

Runtime::Runtime(RuntimeConfig config, std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , logger_(std::move(logger))
    , builders_(Features::FeatureBuilderRegistry::with_builtin_builders())
    , registry_(std::make_shared<Skills::SkillRegistry>(logger_))
    , sigma_gates_(make_sigma_gates(config_))
    , decisions_(sigma_gates_)
{
    auto backend_factory = Inference::backend_factory_by_name(config_.backend);
    if (!backend_factory) {
        throw std::invalid_argument("unknown inference backend: " + config_.backend);
    }

    telemetry_ = std::make_shared<Telemetry::TelemetrySink>(
        config_.telemetry_dir,
        Telemetry::SamplingConfig(config_.sampling, config_.default_sample_rate),
        Telemetry::Clock{},
        config_.telemetry_seed,
        logger_);

    hub_ = std::make_shared<Inference::InferenceHub>(
        registry_, builders_, std::move(backend_factory), definition_source(config_), logger_);
    router_ = std::make_shared<Routing::Router>(registry_, telemetry_, logger_);

    if (!config_.public_key.empty()) {
        verifier_ = std::make_shared<Updates::ManifestVerifier>(
            Updates::ManifestVerifier::from_base64(config_.public_key));
        installer_ = std::make_shared<Updates::SkillUpdateInstaller>(
            verifier_, registry_, builders_, hub_->runner_factory(), logger_);
    }

    if (logger_) {
        logger_->debug("[Runtime] Components created (backend=" + config_.backend + ")");
    }
}

void Runtime::start() {
    hub_->init();
    hub_->set_idle_mode(config_.idle);
    if (logger_) {
        logger_->info("[Runtime] Started with " + std::to_string(registry_->skill_count()) + " skills");
    }
}

} // namespace SkillRuntime
