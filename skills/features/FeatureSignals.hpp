/**
 * @file skills/features/FeatureSignals.hpp
 * @brief Signal extraction helpers shared by the domain feature builders.
 *
 * Every helper returns finite values: NaN becomes 0 and infinities become +-1.
 */
#pragma once

#include "skills/payload/Payload.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace SkillRuntime::Features {

using Skills::FeatureVector;
using Skills::Payload;

/// Default input width of the on-device inference backends.
constexpr std::size_t DEFAULT_FEATURE_INPUT_DIM = 64;

/// @brief value / scale clamped to [-1, 1]; 0 when absent or scale is 0.
[[nodiscard]] float normalize(std::optional<double> value, double scale);

/// @brief part / total clamped to [-1, 1]; 0 when either is absent or total is 0.
[[nodiscard]] float ratio(std::optional<double> part, std::optional<double> total);

/// @brief Relative change of @p current against @p reference (divisor |reference|, or 1 when 0).
[[nodiscard]] float delta(std::optional<double> current, std::optional<double> reference);

/// @brief count / max clamped to [0, 1].
[[nodiscard]] float normalized_count(std::optional<double> count, double max);

/// @brief Length of @p text over @p max_length, capped at 1.
[[nodiscard]] float normalized_length(const std::optional<std::string>& text, std::size_t max_length);

/// @brief One 0/1 flag per keyword: does the lowercased text contain it.
[[nodiscard]] std::vector<float> keyword_flags(
    const std::optional<std::string>& text,
    const std::vector<std::string>& keywords
);

/**
 * @brief Four coefficients read from a formula string such as "2x + 3 = 7".
 *
 * Slots 0-2 take the first numbers found (scaled by 100), slot 3 the sum of
 * absolute values of all numbers (scaled by 400). All zeros when blank.
 */
[[nodiscard]] std::vector<float> formula_coefficients(const std::optional<std::string>& formula);

/// @brief Replace NaN with 0 and infinities with their sign.
[[nodiscard]] float clean(float value);

/**
 * @brief Fit a signal list to exactly @p dim slots.
 *
 * The first @p dim signals fill the vector; any further signal i is added to
 * slot i % dim and the slot is clamped back to [-1, 1]. Short lists are
 * zero-padded.
 * @throws std::invalid_argument if @p dim is 0.
 */
[[nodiscard]] FeatureVector compose_vector(const std::vector<float>& signals, std::size_t dim);

} // namespace SkillRuntime::Features
