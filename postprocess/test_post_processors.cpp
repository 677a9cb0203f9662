/**
 * @file test_post_processors.cpp
 * @brief Tests for localized skill summaries.
 */

#include <gtest/gtest.h>

#include <string>

#include "postprocess/PostProcessors.hpp"

using namespace SkillRuntime::PostProcess;
using SkillRuntime::Skills::FeatureVector;

TEST(PostProcessors, EducationUsesSubject) {
    PostProcessorTable table;
    auto summary = table.post_process("education_assistant", FeatureVector(64, 0.1f), {{"subject", "化学"}});

    EXPECT_EQ(summary.zh_cn, "已为化学准备个性化学习指导");
    EXPECT_EQ(summary.english, "Personalized study guidance prepared for 化学");
    EXPECT_TRUE(summary.has_chinese_translation());
}

TEST(PostProcessors, EducationDefaultsSubject) {
    PostProcessorTable table;
    auto summary = table.post_process("education_assistant", {}, nlohmann::json::object());
    EXPECT_EQ(summary.zh_cn, "已为学习准备个性化学习指导");
}

TEST(PostProcessors, RetailFormatsScoreAndPrice) {
    PostProcessorTable table;
    auto summary = table.post_process("retail_helper", {0.2f, 0.875f, 0.5f},
                                      {{"product", "耳机"}, {"price", "¥299"}});

    EXPECT_EQ(summary.zh_cn, "推荐耳机，评分0.88，价格¥299");
    EXPECT_EQ(summary.english, "Retail recommendation for 耳机 (score 0.88), priced at ¥299");
}

TEST(PostProcessors, RetailWithoutPrice) {
    PostProcessorTable table;
    auto summary = table.post_process("retail_helper", {0.5f}, {{"product", "Lamp"}});
    EXPECT_EQ(summary.zh_cn, "推荐Lamp，评分0.50");
}

TEST(PostProcessors, TravelClampsConfidence) {
    PostProcessorTable table;
    auto summary = table.post_process("travel_planner", {0.4f, 1.7f},
                                      {{"destination", "京都"}, {"itinerary", "Day 1: 清水寺"}});

    EXPECT_EQ(summary.zh_cn, "已为京都规划行程，置信度100%：Day 1: 清水寺");
    EXPECT_EQ(summary.english, "Itinerary generated for 京都 with 100% confidence: Day 1: 清水寺");
}

TEST(PostProcessors, TravelPercentRounds) {
    PostProcessorTable table;
    auto summary = table.post_process("travel_planner", {0.5f}, {{"destination", "Paris"}});
    EXPECT_EQ(summary.zh_cn, "已为Paris规划行程，置信度50%");
}

TEST(PostProcessors, UnknownSkillUsesGenericSummary) {
    PostProcessorTable table;
    EXPECT_FALSE(table.has("energy_monitor"));

    auto generic = table.post_process("energy_monitor", {0.3f});
    EXPECT_EQ(generic.english, "Skill energy_monitor completed");
    EXPECT_EQ(generic.zh_cn, "技能energy_monitor已完成");

    auto provided = table.post_process("energy_monitor", {0.3f}, {{"summary", "Grid stable"}, {"summaryZh", "电网稳定"}});
    EXPECT_EQ(provided.as_map().at("en-US"), "Grid stable");
    EXPECT_EQ(provided.as_map().at("zh-CN"), "电网稳定");
}

TEST(PostProcessors, BlankFieldsFallBack) {
    PostProcessorTable table;
    table.add("finance_coach", [](const FeatureVector&, const nlohmann::json&) {
        return LocalizedSkillSummary{"Budget ready", "   "};
    });

    EXPECT_TRUE(table.has("finance_coach"));
    auto summary = table.post_process("finance_coach", {});
    EXPECT_EQ(summary.english, "Budget ready");
    EXPECT_EQ(summary.zh_cn, "技能finance_coach已完成");
}

TEST(PostProcessors, ChineseTranslationCheck) {
    EXPECT_FALSE((LocalizedSkillSummary{"done", ""}).has_chinese_translation());
    EXPECT_FALSE((LocalizedSkillSummary{"done", " \n"}).has_chinese_translation());
    EXPECT_TRUE((LocalizedSkillSummary{"done", "完成"}).has_chinese_translation());
}
