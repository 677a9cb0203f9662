/**
 * @file test_router.cpp
 * @brief Tests for Router outcomes and the telemetry they record.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include "router/Router.hpp"

using namespace SkillRuntime::Routing;
using namespace SkillRuntime::Skills;
using SkillRuntime::Features::FeatureBuilderRegistry;
using SkillRuntime::Features::IFeatureBuilder;
using SkillRuntime::Telemetry::TelemetrySink;

namespace {

// Builder that violates the fixed-width contract.
class ShortBuilder : public IFeatureBuilder {
public:
    const std::string& name() const noexcept override { return name_; }
    FeatureVector build(const Payload&, std::size_t) const override { return {1.0f}; }

private:
    std::string name_{"short"};
};

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("skill-runtime-router-" + std::to_string(std::random_device{}()));
        registry_ = std::make_shared<SkillRegistry>();
        telemetry_ = std::make_shared<TelemetrySink>(dir_);
        router_ = std::make_unique<Router>(registry_, telemetry_);
        builders_ = FeatureBuilderRegistry::with_builtin_builders();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void register_education(std::shared_ptr<VectorRunner> runner) {
        std::shared_ptr<VectorSkill> descriptor =
            std::make_shared<FeatureBuilderDescriptor>(builders_->find("education"), std::move(runner));
        registry_->register_skill("education_assistant", descriptor, {"learning"});
    }

    std::filesystem::path dir_;
    std::shared_ptr<SkillRegistry> registry_;
    std::shared_ptr<TelemetrySink> telemetry_;
    std::unique_ptr<Router> router_;
    std::shared_ptr<FeatureBuilderRegistry> builders_;
};

}  // namespace

TEST_F(RouterTest, SuccessReturnsRunnerOutput) {
    register_education(std::make_shared<EchoRunner<FeatureVector>>());

    auto result = router_->route("education_assistant", Payload{{"gradeLevel", 9.0}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().size(), 64u);
    EXPECT_FLOAT_EQ(result.value()[0], 0.75f);
    EXPECT_THROW((void)result.error(), std::logic_error);

    EXPECT_EQ(telemetry_->event_names(), (std::vector<std::string>{"router.success.education_assistant"}));
    auto event = telemetry_->events().front();
    EXPECT_DOUBLE_EQ(event["metrics"]["router.success"].get<double>(), 1.0);
    EXPECT_DOUBLE_EQ(event["metrics"]["router.failure"].get<double>(), 0.0);
}

TEST_F(RouterTest, UnknownSkillIsNotFound) {
    auto result = router_->route("ghost", Payload{});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, RouteErrorKind::NotFound);
    EXPECT_EQ(result.error().skill_id, "ghost");
    EXPECT_THROW((void)result.value(), std::logic_error);

    auto events = telemetry_->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["event"].get<std::string>(), "router.failure.ghost");
    EXPECT_EQ(events[0]["attributes"]["error_category"].get<std::string>(), "not_found");
}

TEST_F(RouterTest, TypeMismatch) {
    std::shared_ptr<ISkillDescriptor<std::string, FeatureVector, FeatureVector>> text =
        std::make_shared<TextPipelineDescriptor>(std::make_shared<EchoRunner<FeatureVector>>());
    registry_->register_skill("text_skill", text);

    auto result = router_->route("text_skill", Payload{});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, RouteErrorKind::TypeMismatch);

    auto typed = router_->route_skill<std::string, FeatureVector, FeatureVector>("text_skill", "hello world");
    EXPECT_TRUE(typed.ok());
}

TEST_F(RouterTest, BuildFailureCarriesCause) {
    std::shared_ptr<VectorSkill> descriptor = std::make_shared<FeatureBuilderDescriptor>(
        std::make_shared<ShortBuilder>(), std::make_shared<EchoRunner<FeatureVector>>(), 8);
    registry_->register_skill("broken", descriptor);

    auto result = router_->route("broken", Payload{});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, RouteErrorKind::BuildFailed);
    ASSERT_TRUE(result.error().cause != nullptr);
    EXPECT_THROW(std::rethrow_exception(result.error().cause), SkillRuntime::Features::FeatureInvariantError);
    EXPECT_EQ(telemetry_->event_names(), (std::vector<std::string>{"router.failure.broken"}));
}

TEST_F(RouterTest, RunFailureIsReported) {
    register_education(std::make_shared<FunctionRunner<FeatureVector, FeatureVector>>(
        [](const FeatureVector&) -> FeatureVector { throw std::runtime_error("model unavailable"); }));

    auto result = router_->route("education_assistant", Payload{});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, RouteErrorKind::RunFailed);
    EXPECT_EQ(result.error().message, "model unavailable");

    auto events = telemetry_->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["event"].get<std::string>(), "router.failure.education_assistant");
    EXPECT_EQ(events[0]["attributes"]["error"].get<std::string>(), "model unavailable");
    EXPECT_DOUBLE_EQ(events[0]["metrics"]["router.failure"].get<double>(), 1.0);
}

TEST_F(RouterTest, RouteByTrigger) {
    register_education(std::make_shared<EchoRunner<FeatureVector>>());

    auto hit = router_->route_trigger<Payload, FeatureVector, FeatureVector>("  LEARNING ", Payload{});
    EXPECT_TRUE(hit.ok());

    auto miss = router_->route_trigger<Payload, FeatureVector, FeatureVector>("Cooking", Payload{});
    ASSERT_FALSE(miss.ok());
    EXPECT_EQ(miss.error().kind, RouteErrorKind::NotFound);
    EXPECT_EQ(miss.error().skill_id, "cooking");

    EXPECT_EQ(telemetry_->event_names(), (std::vector<std::string>{
        "router.success.education_assistant", "router.failure.cooking"}));
}

TEST_F(RouterTest, EncodedRequests) {
    register_education(std::make_shared<EchoRunner<FeatureVector>>());

    auto by_id = router_->route_encoded(encode_skill_request("education_assistant", Payload{{"gradeLevel", 6.0}}));
    ASSERT_TRUE(by_id.ok());
    EXPECT_FLOAT_EQ(by_id.value()[0], 0.5f);

    auto by_trigger = router_->route_encoded(encode_skill_request("", Payload{}, "learning"));
    EXPECT_TRUE(by_trigger.ok());

    std::vector<uint8_t> garbage{0xde, 0xad, 0xbe, 0xef};
    auto bad = router_->route_encoded(garbage);
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().kind, RouteErrorKind::DecodeFailed);
    EXPECT_EQ(bad.error().skill_id, Router::UNDECODABLE_REQUEST);
}

TEST_F(RouterTest, WorksWithoutTelemetry) {
    Router quiet(registry_);
    auto result = quiet.route("ghost", Payload{});
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(telemetry_->events().empty());
    EXPECT_THROW(Router(nullptr), std::invalid_argument);
}
