/**
 * @file decision/DecisionEngine.hpp
 * @brief Confidence gating with health-disclaimer injection.
 */
#pragma once

#include "SigmaGateTable.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace SkillRuntime::Decision {

inline constexpr const char* ACTION_ASK = "ask";
inline constexpr const char* ACTION_PROCEED = "proceed";

/// English health disclaimer.
extern const char* const HEALTH_DISCLAIMER_EN;
/// Simplified Chinese health disclaimer.
extern const char* const HEALTH_DISCLAIMER_ZH;

/**
 * @brief Result of the simple decision mode.
 */
struct DecisionOutcome {
    std::string action;   ///< "ask" or "proceed"
    std::string message;  ///< Base message, plus disclaimer for health skills
    double confidence;
    double sigma_gate;
};

/**
 * @brief Input of the metadata decision mode.
 *
 * A numeric metadata["sigmaGate"] overrides the table gate for this call.
 */
struct MetadataDecision {
    std::string id;
    std::string skill_name;
    double confidence;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Result of the metadata decision mode.
 *
 * metadata holds the input metadata plus "sigmaGate" (the gate used) and,
 * for a health skill below its gate, "complianceDisclaimers" keyed by locale.
 */
struct MetadataDecisionOutcome {
    std::string id;
    std::string action;   ///< "ask", or the skill name when the gate is met
    double confidence;
    nlohmann::json metadata;
};

/**
 * @brief Compares a confidence against the skill's sigma gate.
 *
 * A confidence equal to the gate meets it. Confidences are not range checked.
 */
class DecisionEngine {
public:
    explicit DecisionEngine(std::shared_ptr<const SigmaGateTable> gates = std::make_shared<SigmaGateTable>());

    /**
     * @brief Simple mode: "ask" below the gate, else "proceed".
     *
     * For health skills the English and Chinese disclaimers are appended after
     * a blank line (or stand alone when @p base_message is empty); other
     * skills get @p base_message verbatim.
     */
    [[nodiscard]] DecisionOutcome make_decision(
        const std::string& skill_id,
        double confidence,
        const std::string& base_message = ""
    ) const;

    /**
     * @brief Metadata mode.
     * @param sigma_gate_override Takes precedence over metadata and table gates.
     */
    [[nodiscard]] MetadataDecisionOutcome decide(
        const MetadataDecision& decision,
        std::optional<double> sigma_gate_override = std::nullopt
    ) const;

    /// @brief {"en-US": [...], "zh-CN": [...]} compliance disclaimer map.
    [[nodiscard]] static nlohmann::json compliance_disclaimers();

    [[nodiscard]] const SigmaGateTable& gates() const noexcept { return *gates_; }

private:
    std::shared_ptr<const SigmaGateTable> gates_;
};

} // namespace SkillRuntime::Decision
