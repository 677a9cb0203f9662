/**
 * @file decision/DecisionEngine.cpp
 */
#include "DecisionEngine.hpp"

#include <stdexcept>

namespace SkillRuntime::Decision {

const char* const HEALTH_DISCLAIMER_EN =
    "This information is for general awareness only and does not constitute medical advice. "
    "Please consult a healthcare professional for medical concerns.";

const char* const HEALTH_DISCLAIMER_ZH =
    "此信息仅供一般参考，不构成医疗建议。如有健康问题，请咨询专业医疗人员。";

namespace {

std::string with_disclaimer(const std::string& message) {
    const std::string disclaimer = std::string{HEALTH_DISCLAIMER_EN} + "\n" + HEALTH_DISCLAIMER_ZH;
    if (message.empty()) {
        return disclaimer;
    }
    return message + "\n\n" + disclaimer;
}

} // anonymous namespace

DecisionEngine::DecisionEngine(std::shared_ptr<const SigmaGateTable> gates)
    : gates_(std::move(gates))
{
    if (!gates_) {
        throw std::invalid_argument("DecisionEngine: sigma gate table cannot be null");
    }
}

DecisionOutcome DecisionEngine::make_decision(
    const std::string& skill_id,
    double confidence,
    const std::string& base_message
) const {
    const double gate = gates_->gate_for(skill_id);
    return DecisionOutcome{
        .action = confidence < gate ? ACTION_ASK : ACTION_PROCEED,
        .message = is_health_skill(skill_id) ? with_disclaimer(base_message) : base_message,
        .confidence = confidence,
        .sigma_gate = gate,
    };
}

MetadataDecisionOutcome DecisionEngine::decide(
    const MetadataDecision& decision,
    std::optional<double> sigma_gate_override
) const {
    nlohmann::json metadata = decision.metadata.is_object() ? decision.metadata : nlohmann::json::object();

    double gate = gates_->gate_for(decision.skill_name);
    if (sigma_gate_override) {
        gate = *sigma_gate_override;
    } else if (auto it = metadata.find("sigmaGate"); it != metadata.end() && it->is_number()) {
        gate = it->get<double>();
    }
    metadata["sigmaGate"] = gate;

    const bool below_gate = decision.confidence < gate;
    if (below_gate && is_health_skill(decision.skill_name)) {
        metadata["complianceDisclaimers"] = compliance_disclaimers();
    }

    return MetadataDecisionOutcome{
        .id = decision.id,
        .action = below_gate ? ACTION_ASK : decision.skill_name,
        .confidence = decision.confidence,
        .metadata = std::move(metadata),
    };
}

nlohmann::json DecisionEngine::compliance_disclaimers() {
    return {
        {"en-US", nlohmann::json::array({HEALTH_DISCLAIMER_EN})},
        {"zh-CN", nlohmann::json::array({HEALTH_DISCLAIMER_ZH})},
    };
}

} // namespace SkillRuntime::Decision
