/**
 * @file test_decision.cpp
 * @brief Tests for sigma gates and the two decision modes.
 */

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "decision/DecisionEngine.hpp"

using namespace SkillRuntime::Decision;

namespace {

std::string disclaimer_block() {
    return std::string{HEALTH_DISCLAIMER_EN} + "\n" + HEALTH_DISCLAIMER_ZH;
}

}  // namespace

// =============================================================================
// SIGMA GATES
// =============================================================================

TEST(SigmaGateTable, HealthDefaults) {
    SigmaGateTable table;
    EXPECT_DOUBLE_EQ(table.gate_for("hc_gait_guard"), 0.82);
    EXPECT_DOUBLE_EQ(table.gate_for("hc_med_sentinel"), 0.88);
    EXPECT_DOUBLE_EQ(table.gate_for("hc_sun_hydro"), 0.78);
    EXPECT_DOUBLE_EQ(table.gate_for("retail_helper"), DEFAULT_SIGMA_GATE);
    EXPECT_FALSE(table.find_gate("retail_helper").has_value());
}

TEST(SigmaGateTable, SetGateValidatesRange) {
    SigmaGateTable table;
    table.set_gate("finance_coach", 0.65);
    EXPECT_TRUE(table.has_gate("finance_coach"));
    EXPECT_DOUBLE_EQ(table.gate_for("finance_coach"), 0.65);

    EXPECT_THROW(table.set_gate("finance_coach", 1.5), std::invalid_argument);
    EXPECT_THROW(table.set_gate("finance_coach", -0.1), std::invalid_argument);
    EXPECT_DOUBLE_EQ(table.gate_for("finance_coach"), 0.65);
    EXPECT_EQ(table.gates().size(), 4u);
}

TEST(SigmaGateTable, HealthPrefix) {
    EXPECT_TRUE(is_health_skill("hc_gait_guard"));
    EXPECT_TRUE(is_health_skill("hc_new_skill"));
    EXPECT_FALSE(is_health_skill("health_hc"));
    EXPECT_FALSE(is_health_skill("education_assistant"));
}

// =============================================================================
// SIMPLE MODE
// =============================================================================

TEST(DecisionEngine, GateIsInclusive) {
    DecisionEngine engine;

    auto at_gate = engine.make_decision("hc_gait_guard", 0.82);
    EXPECT_EQ(at_gate.action, ACTION_PROCEED);
    EXPECT_DOUBLE_EQ(at_gate.sigma_gate, 0.82);

    auto below = engine.make_decision("hc_gait_guard", 0.75);
    EXPECT_EQ(below.action, ACTION_ASK);
    EXPECT_DOUBLE_EQ(below.confidence, 0.75);
}

TEST(DecisionEngine, HealthMessagesCarryBothDisclaimers) {
    DecisionEngine engine;

    auto with_base = engine.make_decision("hc_sun_hydro", 0.9, "Drink water");
    EXPECT_EQ(with_base.message, "Drink water\n\n" + disclaimer_block());

    auto without_base = engine.make_decision("hc_med_sentinel", 0.1);
    EXPECT_EQ(without_base.message, disclaimer_block());
    EXPECT_NE(without_base.message.find(HEALTH_DISCLAIMER_ZH), std::string::npos);
}

TEST(DecisionEngine, OtherSkillsKeepMessageVerbatim) {
    DecisionEngine engine;
    auto outcome = engine.make_decision("retail_helper", 0.4, "Check the price");
    EXPECT_EQ(outcome.action, ACTION_ASK);
    EXPECT_EQ(outcome.message, "Check the price");
    EXPECT_DOUBLE_EQ(outcome.sigma_gate, DEFAULT_SIGMA_GATE);

    auto empty = engine.make_decision("retail_helper", 0.9);
    EXPECT_EQ(empty.action, ACTION_PROCEED);
    EXPECT_EQ(empty.message, "");
}

TEST(DecisionEngine, UsesSharedTable) {
    auto table = std::make_shared<SigmaGateTable>();
    DecisionEngine engine(table);
    table->set_gate("finance_coach", 0.65);
    EXPECT_EQ(engine.make_decision("finance_coach", 0.6).action, ACTION_ASK);
    EXPECT_EQ(engine.make_decision("finance_coach", 0.7).action, ACTION_PROCEED);
    EXPECT_THROW(DecisionEngine(nullptr), std::invalid_argument);
}

// =============================================================================
// METADATA MODE
// =============================================================================

TEST(DecisionEngine, MetadataProceedUsesSkillName) {
    DecisionEngine engine;
    auto outcome = engine.decide({"req-1", "retail_helper", 0.7, {{"channel", "voice"}}});

    EXPECT_EQ(outcome.id, "req-1");
    EXPECT_EQ(outcome.action, "retail_helper");
    EXPECT_DOUBLE_EQ(outcome.metadata["sigmaGate"].get<double>(), DEFAULT_SIGMA_GATE);
    EXPECT_EQ(outcome.metadata["channel"].get<std::string>(), "voice");
    EXPECT_FALSE(outcome.metadata.contains("complianceDisclaimers"));
}

TEST(DecisionEngine, MetadataHealthBelowGateAddsDisclaimers) {
    DecisionEngine engine;
    auto outcome = engine.decide({"req-2", "hc_gait_guard", 0.5});

    EXPECT_EQ(outcome.action, ACTION_ASK);
    ASSERT_TRUE(outcome.metadata.contains("complianceDisclaimers"));
    const auto& disclaimers = outcome.metadata["complianceDisclaimers"];
    EXPECT_EQ(disclaimers["en-US"][0].get<std::string>(), HEALTH_DISCLAIMER_EN);
    EXPECT_EQ(disclaimers["zh-CN"][0].get<std::string>(), HEALTH_DISCLAIMER_ZH);
    EXPECT_EQ(disclaimers, DecisionEngine::compliance_disclaimers());
}

TEST(DecisionEngine, MetadataHealthAboveGateHasNoDisclaimers) {
    DecisionEngine engine;
    auto outcome = engine.decide({"req-3", "hc_gait_guard", 0.95});
    EXPECT_EQ(outcome.action, "hc_gait_guard");
    EXPECT_FALSE(outcome.metadata.contains("complianceDisclaimers"));
}

TEST(DecisionEngine, GatePrecedence) {
    DecisionEngine engine;

    // Metadata gate beats the table.
    auto from_metadata = engine.decide({"a", "hc_gait_guard", 0.7, {{"sigmaGate", 0.6}}});
    EXPECT_EQ(from_metadata.action, "hc_gait_guard");
    EXPECT_DOUBLE_EQ(from_metadata.metadata["sigmaGate"].get<double>(), 0.6);

    // Explicit override beats metadata.
    auto overridden = engine.decide({"b", "hc_gait_guard", 0.7, {{"sigmaGate", 0.6}}}, 0.9);
    EXPECT_EQ(overridden.action, ACTION_ASK);
    EXPECT_DOUBLE_EQ(overridden.metadata["sigmaGate"].get<double>(), 0.9);

    // Non-numeric metadata gates are ignored.
    auto ignored = engine.decide({"c", "hc_gait_guard", 0.8, {{"sigmaGate", "low"}}});
    EXPECT_EQ(ignored.action, ACTION_ASK);
    EXPECT_DOUBLE_EQ(ignored.metadata["sigmaGate"].get<double>(), 0.82);
}
