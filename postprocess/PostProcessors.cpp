/**
 * @file postprocess/PostProcessors.cpp
 * @brief Built-in post-processors.
 */
#include "PostProcessors.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <optional>
#include <sstream>

namespace SkillRuntime::PostProcess {
namespace {

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// Non-blank text view of a metadata field; numbers and booleans are rendered.
std::optional<std::string> field(const nlohmann::json& metadata, const char* key) {
    if (!metadata.is_object()) {
        return std::nullopt;
    }
    auto it = metadata.find(key);
    if (it == metadata.end() || it->is_null()) {
        return std::nullopt;
    }
    std::string text = it->is_string() ? it->get<std::string>() : it->dump();
    if (is_blank(text)) {
        return std::nullopt;
    }
    return text;
}

std::string fixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

float top_score(const FeatureVector& output) {
    if (output.empty()) {
        return 0.0f;
    }
    return *std::max_element(output.begin(), output.end());
}

LocalizedSkillSummary education_summary(const FeatureVector&, const nlohmann::json& metadata) {
    const auto subject = field(metadata, "subject").value_or("学习");
    return {
        "Personalized study guidance prepared for " + subject,
        "已为" + subject + "准备个性化学习指导",
    };
}

LocalizedSkillSummary retail_summary(const FeatureVector& output, const nlohmann::json& metadata) {
    const auto product = field(metadata, "product").value_or("商品");
    const auto price = field(metadata, "price");
    const auto score = fixed(top_score(output), 2);

    std::string english = "Retail recommendation for " + product + " (score " + score + ")";
    std::string chinese = "推荐" + product + "，评分" + score;
    if (price) {
        english += ", priced at " + *price;
        chinese += "，价格" + *price;
    }
    return {english, chinese};
}

LocalizedSkillSummary travel_summary(const FeatureVector& output, const nlohmann::json& metadata) {
    const auto destination = field(metadata, "destination").value_or("旅程");
    const auto itinerary = field(metadata, "itinerary");
    const float confidence = std::clamp(top_score(output), 0.0f, 1.0f);
    const auto percent = fixed(confidence * 100.0, 0);

    std::string english = "Itinerary generated for " + destination + " with " + percent + "% confidence";
    std::string chinese = "已为" + destination + "规划行程，置信度" + percent + "%";
    if (itinerary) {
        english += ": " + *itinerary;
        chinese += "：" + *itinerary;
    }
    return {english, chinese};
}

} // anonymous namespace

bool LocalizedSkillSummary::has_chinese_translation() const {
    return !is_blank(zh_cn);
}

PostProcessorTable::PostProcessorTable()
    : processors_{
        {"education_assistant", education_summary},
        {"retail_helper", retail_summary},
        {"travel_planner", travel_summary},
    }
{
}

void PostProcessorTable::add(const std::string& skill_id, SkillPostProcessor processor) {
    std::lock_guard<std::mutex> lock(mutex_);
    processors_[skill_id] = std::move(processor);
}

bool PostProcessorTable::has(const std::string& skill_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processors_.count(skill_id) > 0;
}

LocalizedSkillSummary PostProcessorTable::post_process(
    const std::string& skill_id,
    const FeatureVector& output,
    const nlohmann::json& metadata
) const {
    SkillPostProcessor processor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processors_.find(skill_id);
        if (it != processors_.end()) {
            processor = it->second;
        }
    }
    if (!processor) {
        return default_summary(skill_id, metadata);
    }

    auto summary = processor(output, metadata);
    if (is_blank(summary.english) || is_blank(summary.zh_cn)) {
        auto fallback = default_summary(skill_id, metadata);
        if (is_blank(summary.english)) summary.english = fallback.english;
        if (is_blank(summary.zh_cn)) summary.zh_cn = fallback.zh_cn;
    }
    return summary;
}

LocalizedSkillSummary PostProcessorTable::default_summary(
    const std::string& skill_id,
    const nlohmann::json& metadata
) {
    return {
        field(metadata, "summary").value_or("Skill " + skill_id + " completed"),
        field(metadata, "summaryZh").value_or("技能" + skill_id + "已完成"),
    };
}

} // namespace SkillRuntime::PostProcess
