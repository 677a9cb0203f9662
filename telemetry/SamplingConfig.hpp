/**
 * @file telemetry/SamplingConfig.hpp
 * @brief Per-category retention rates for telemetry events.
 */
#pragma once

#include <map>
#include <random>
#include <string>

namespace SkillRuntime::Telemetry {

/**
 * @brief Event-name prefix -> retention probability, plus a default rate.
 *
 * The rule with the longest prefix of the event name decides; events matching
 * no rule use the default rate. Immutable after construction.
 */
class SamplingConfig {
public:
    /**
     * @throws std::invalid_argument for a rate outside [0, 1] or a blank prefix.
     */
    explicit SamplingConfig(std::map<std::string, double> rules = {}, double default_rate = 1.0);

    [[nodiscard]] double rate_for(const std::string& event) const;

    /// @brief Draw against the event's rate; 1.0 always keeps, 0.0 never does.
    [[nodiscard]] bool should_sample(const std::string& event, std::mt19937_64& rng) const;

    [[nodiscard]] const std::map<std::string, double>& rules() const noexcept { return rules_; }
    [[nodiscard]] double default_rate() const noexcept { return default_rate_; }

private:
    std::map<std::string, double> rules_;
    double default_rate_;
};

} // namespace SkillRuntime::Telemetry
