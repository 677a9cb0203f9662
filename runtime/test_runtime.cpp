/**
 * @file test_runtime.cpp
 * @brief Tests for runtime configuration and the assembled skill pipeline.
 */

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "logger.hpp"
#include "runtime/Runtime.hpp"

using namespace SkillRuntime;
using SkillRuntime::Skills::FeatureVector;
using SkillRuntime::Skills::Payload;

namespace {

const std::string kSkillsFile = std::string{SKILL_RUNTIME_SOURCE_DIR} + "/config/skills.json";

class RuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("skill-runtime-e2e-" + std::to_string(std::random_device{}()));
        logger_ = std::make_shared<Logger>("RuntimeTest");
        logger_->add_sink(std::make_unique<VectorSink>());
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    RuntimeConfig config() const {
        RuntimeConfig config;
        config.skills_path = kSkillsFile;
        config.telemetry_dir = dir_;
        return config;
    }

    static Payload education_payload() {
        return Payload{{"gradeLevel", 9.0}, {"difficulty", 6.0}, {"correctCount", 7.0}, {"incorrectCount", 2.0}};
    }

    std::filesystem::path dir_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace

// =============================================================================
// CONFIG
// =============================================================================

TEST(RuntimeConfig, NullSectionGivesDefaults) {
    auto config = runtime_opts::config_from_json(nlohmann::json{});
    EXPECT_EQ(config.backend, "echo");
    EXPECT_DOUBLE_EQ(config.default_sample_rate, 1.0);
    EXPECT_FALSE(config.idle);
    EXPECT_TRUE(config.public_key.empty());
    EXPECT_FALSE(config.telemetry_seed.has_value());
    EXPECT_EQ(config.log_level, LogLevel::Info);
}

TEST(RuntimeConfig, ReadsEveryKey) {
    auto config = runtime_opts::config_from_json(nlohmann::json{
        {"skills", "/opt/skills/skills.json"},
        {"telemetry_dir", "/var/lib/skills/telemetry"},
        {"backend", "offset"},
        {"log_level", "DEBUG"},
        {"default_sample_rate", 0.25},
        {"sampling", {{"router", 1.0}, {"tts", 0.1}}},
        {"sigma_gates", {{"finance_coach", 0.65}}},
        {"idle", true},
        {"telemetry_seed", 99},
    });

    EXPECT_EQ(config.skills_path, std::filesystem::path{"/opt/skills/skills.json"});
    EXPECT_EQ(config.telemetry_dir, std::filesystem::path{"/var/lib/skills/telemetry"});
    EXPECT_EQ(config.backend, "offset");
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_DOUBLE_EQ(config.default_sample_rate, 0.25);
    EXPECT_DOUBLE_EQ(config.sampling.at("tts"), 0.1);
    EXPECT_DOUBLE_EQ(config.sigma_gates.at("finance_coach"), 0.65);
    EXPECT_TRUE(config.idle);
    EXPECT_EQ(config.telemetry_seed.value(), 99u);
}

TEST(RuntimeConfig, RejectsBadValues) {
    EXPECT_THROW((void)runtime_opts::config_from_json(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW((void)runtime_opts::config_from_json({{"log_level", "chatty"}}), std::invalid_argument);
    EXPECT_THROW((void)runtime_opts::config_from_json({{"idle", "yes"}}), std::invalid_argument);
    EXPECT_THROW((void)runtime_opts::config_from_json({{"telemetry_seed", -4}}), std::invalid_argument);
    EXPECT_THROW((void)runtime_opts::config_from_json({{"sampling", {{"router", "all"}}}}), std::invalid_argument);
    EXPECT_THROW((void)runtime_opts::config_from_json({{"backend", 3}}), std::invalid_argument);
}

// =============================================================================
// PIPELINE
// =============================================================================

TEST_F(RuntimeTest, EducationRequestEndToEnd) {
    Runtime runtime(config(), logger_);
    runtime.start();

    EXPECT_TRUE(runtime.hub()->is_initialized());
    EXPECT_EQ(runtime.registry()->skill_count(), 14u);
    EXPECT_EQ(runtime.verifier(), nullptr);
    EXPECT_EQ(runtime.installer(), nullptr);

    auto result = runtime.router()->route("education_assistant", education_payload());
    ASSERT_TRUE(result.ok());
    const FeatureVector& output = result.value();
    ASSERT_EQ(output.size(), 64u);
    EXPECT_FLOAT_EQ(output[0], 0.75f);
    for (float value : output) {
        EXPECT_TRUE(std::isfinite(value));
    }
    EXPECT_EQ(runtime.hub()->sessions_created(), 1u);

    auto summary = runtime.post_processors().post_process("education_assistant", output, {{"subject", "化学"}});
    EXPECT_TRUE(summary.has_chinese_translation());
    EXPECT_EQ(summary.zh_cn, "已为化学准备个性化学习指导");

    EXPECT_EQ(runtime.telemetry()->event_names(),
              (std::vector<std::string>{"router.success.education_assistant"}));
}

TEST_F(RuntimeTest, TriggerReachesHealthSkillAndGates) {
    Runtime runtime(config(), logger_);
    runtime.start();

    auto result = runtime.router()->route_trigger<Payload, FeatureVector, FeatureVector>(
        "Fall Risk", Payload{{"heartRate", 72.0}});
    ASSERT_TRUE(result.ok());

    auto outcome = runtime.decisions().make_decision("hc_gait_guard", 0.5, "Walk slowly");
    EXPECT_EQ(outcome.action, Decision::ACTION_ASK);
    EXPECT_NE(outcome.message.find(Decision::HEALTH_DISCLAIMER_ZH), std::string::npos);
}

TEST_F(RuntimeTest, IdleModeReturnsZeros) {
    auto cfg = config();
    cfg.idle = true;
    Runtime runtime(cfg, logger_);
    runtime.start();
    EXPECT_TRUE(runtime.hub()->is_idle());

    auto result = runtime.router()->route("education_assistant", education_payload());
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().size(), 64u);
    for (float value : result.value()) {
        EXPECT_FLOAT_EQ(value, 0.0f);
    }
    EXPECT_EQ(runtime.hub()->active_inference_count(), 0u);
    EXPECT_GE(runtime.hub()->skipped_inference_count(), 1u);
}

TEST_F(RuntimeTest, InlineDefinitionsAndConfiguredGates) {
    auto cfg = config();
    cfg.skills_document = R"({"skills": [{"id": "finance_coach", "featureBuilder": "finance"}]})";
    cfg.sigma_gates = {{"finance_coach", 0.65}};
    Runtime runtime(cfg, logger_);
    runtime.start();

    EXPECT_EQ(runtime.registry()->list_skills(), (std::set<std::string>{"finance_coach"}));
    EXPECT_DOUBLE_EQ(runtime.sigma_gates()->gate_for("finance_coach"), 0.65);
    EXPECT_EQ(runtime.decisions().make_decision("finance_coach", 0.7).action, Decision::ACTION_PROCEED);
}

TEST_F(RuntimeTest, RejectsUnknownBackend) {
    auto cfg = config();
    cfg.backend = "quantum";
    EXPECT_THROW((void)Runtime(cfg, logger_), std::invalid_argument);
}

TEST_F(RuntimeTest, PublicKeyEnablesInstaller) {
    auto cfg = config();
    cfg.public_key = "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=";
    Runtime runtime(cfg, logger_);
    EXPECT_NE(runtime.verifier(), nullptr);
    EXPECT_NE(runtime.installer(), nullptr);

    cfg.public_key = "short";
    EXPECT_THROW((void)Runtime(cfg, logger_), std::invalid_argument);
}
