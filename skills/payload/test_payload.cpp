/**
 * @file test_payload.cpp
 * @brief Tests for payload accessors and the SkillRequest FlatBuffers codec.
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "skills/payload/Payload.hpp"
#include "skills/payload/PayloadCodec.hpp"

using namespace SkillRuntime::Skills;

// =============================================================================
// ACCESSORS
// =============================================================================

TEST(PayloadAccessors, NumberViewOfEachKind) {
    Payload payload{
        {"n", 4.5},
        {"flag", true},
        {"text", std::string{"12.5"}},
        {"word", std::string{"twelve"}},
        {"list", std::vector<std::string>{"a", "b"}},
    };

    EXPECT_DOUBLE_EQ(number_of(payload, "n").value(), 4.5);
    EXPECT_DOUBLE_EQ(number_of(payload, "flag").value(), 1.0);
    EXPECT_DOUBLE_EQ(number_of(payload, "text").value(), 12.5);
    EXPECT_FALSE(number_of(payload, "word").has_value());
    EXPECT_FALSE(number_of(payload, "list").has_value());
    EXPECT_FALSE(number_of(payload, "missing").has_value());
}

TEST(PayloadAccessors, TextViewRendersScalars) {
    Payload payload{{"n", 3.0}, {"flag", false}, {"text", std::string{"hello"}}};

    EXPECT_EQ(text_of(payload, "n").value(), "3");
    EXPECT_EQ(text_of(payload, "flag").value(), "false");
    EXPECT_EQ(text_of(payload, "text").value(), "hello");
    EXPECT_FALSE(text_of(payload, "missing").has_value());
}

TEST(PayloadAccessors, JoinedTextSkipsBlankFields) {
    Payload payload{{"a", std::string{"math"}}, {"b", std::string{"   "}}, {"c", std::string{"exam"}}};

    EXPECT_EQ(joined_text_of(payload, {"a", "b", "c", "missing"}).value(), "math exam");
    EXPECT_FALSE(joined_text_of(payload, {"b", "missing"}).has_value());
}

TEST(PayloadAccessors, CollectionSizeAndFlags) {
    Payload payload{
        {"hints", std::vector<std::string>{"x", "y", "z"}},
        {"name", std::string{"abcd"}},
        {"yes", std::string{"TRUE"}},
        {"one", 1.0},
        {"zero", 0.0},
    };

    EXPECT_DOUBLE_EQ(collection_size_of(payload, "hints").value(), 3.0);
    EXPECT_DOUBLE_EQ(collection_size_of(payload, "name").value(), 4.0);
    EXPECT_FALSE(collection_size_of(payload, "one").has_value());
    EXPECT_EQ(flag_of(payload, "yes"), 1.0f);
    EXPECT_EQ(flag_of(payload, "one"), 1.0f);
    EXPECT_EQ(flag_of(payload, "zero"), 0.0f);
    EXPECT_EQ(flag_of(payload, "missing"), 0.0f);
}

TEST(PayloadJson, KeepsSupportedKindsOnly) {
    auto payload = payload_from_json(nlohmann::json{
        {"grade", 9},
        {"subject", "chemistry"},
        {"flag", true},
        {"tags", {"a", 1, "b"}},
        {"nested", {{"x", 1}}},
        {"nothing", nullptr},
    });

    EXPECT_EQ(payload.size(), 4u);
    EXPECT_DOUBLE_EQ(std::get<double>(payload.at("grade")), 9.0);
    EXPECT_EQ(std::get<std::vector<std::string>>(payload.at("tags")), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(payload.count("nested"), 0u);
    EXPECT_THROW((void)payload_from_json(nlohmann::json::array()), std::invalid_argument);
}

TEST(PayloadJson, RendersEveryKind) {
    Payload payload{
        {"grade", 9.5},
        {"subject", std::string{"化学"}},
        {"flag", true},
        {"tags", std::vector<std::string>{"a", "b"}},
    };

    auto json = payload_to_json(payload);
    ASSERT_TRUE(json.is_object());
    EXPECT_DOUBLE_EQ(json["grade"].get<double>(), 9.5);
    EXPECT_EQ(json["subject"].get<std::string>(), "化学");
    EXPECT_TRUE(json["flag"].get<bool>());
    EXPECT_EQ(json["tags"], (nlohmann::json{"a", "b"}));
    EXPECT_EQ(payload_from_json(json), payload);
    EXPECT_TRUE(payload_to_json(Payload{}).empty());
}

// =============================================================================
// CODEC
// =============================================================================

TEST(PayloadCodec, DecodesEveryValueKind) {
    Payload payload{
        {"gradeLevel", 9.0},
        {"subject", std::string{"化学"}},
        {"needsStepByStep", true},
        {"hints", std::vector<std::string>{"balance", "charge"}},
    };

    auto bytes = encode_skill_request("education_assistant", payload);
    auto decoded = decode_skill_request(bytes);

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->skill_id, "education_assistant");
    EXPECT_TRUE(decoded->trigger.empty());
    EXPECT_EQ(decoded->payload, payload);
}

TEST(PayloadCodec, TriggerOnlyRequest) {
    auto bytes = encode_skill_request("", Payload{}, "Learning");
    auto decoded = decode_skill_request(bytes);

    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->skill_id.empty());
    EXPECT_EQ(decoded->trigger, "Learning");
    EXPECT_TRUE(decoded->payload.empty());
}

TEST(PayloadCodec, RejectsRequestWithoutTarget) {
    auto bytes = encode_skill_request("", Payload{{"x", 1.0}});
    EXPECT_FALSE(decode_skill_request(bytes).has_value());
}

TEST(PayloadCodec, RejectsGarbage) {
    std::vector<uint8_t> garbage{0x01, 0x02, 0x03};
    EXPECT_FALSE(decode_skill_request(garbage).has_value());
    EXPECT_FALSE(decode_skill_request(std::span<const uint8_t>{}).has_value());

    auto bytes = encode_skill_request("retail_helper", Payload{{"price", 10.0}});
    bytes.resize(bytes.size() / 2);
    EXPECT_FALSE(decode_skill_request(bytes).has_value());
}
