/**
 * @file postprocess/PostProcessors.hpp
 * @brief Localized, display-only summaries of skill outputs.
 */
#pragma once

#include "skills/payload/Payload.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace SkillRuntime::PostProcess {

using Skills::FeatureVector;

/**
 * @brief English summary with its Simplified Chinese translation.
 */
struct LocalizedSkillSummary {
    std::string english;
    std::string zh_cn;

    /// @brief {"en-US": english, "zh-CN": zh_cn}
    [[nodiscard]] std::map<std::string, std::string> as_map() const {
        return {{"en-US", english}, {"zh-CN", zh_cn}};
    }

    [[nodiscard]] bool has_chinese_translation() const;
};

/// Builds a summary from a skill output and its contextual metadata object.
using SkillPostProcessor =
    std::function<LocalizedSkillSummary(const FeatureVector& output, const nlohmann::json& metadata)>;

/**
 * @brief skill id -> post-processor, with a generic fallback.
 *
 * Built-in processors: education_assistant (subject), retail_helper (product,
 * price, top score) and travel_planner (destination, itinerary, confidence).
 * Unknown ids use metadata summary/summaryZh or "Skill <id> completed" /
 * "技能<id>已完成".
 */
class PostProcessorTable {
public:
    /// @brief Table with the built-in processors.
    PostProcessorTable();

    /// @brief Add or replace the processor for @p skill_id.
    void add(const std::string& skill_id, SkillPostProcessor processor);

    [[nodiscard]] bool has(const std::string& skill_id) const;

    /// @brief Never returns a blank summary.
    [[nodiscard]] LocalizedSkillSummary post_process(
        const std::string& skill_id,
        const FeatureVector& output,
        const nlohmann::json& metadata = nlohmann::json::object()
    ) const;

    /// @brief The fallback processor for @p skill_id.
    [[nodiscard]] static LocalizedSkillSummary default_summary(
        const std::string& skill_id,
        const nlohmann::json& metadata
    );

private:
    mutable std::mutex mutex_;
    std::map<std::string, SkillPostProcessor> processors_;
};

} // namespace SkillRuntime::PostProcess
