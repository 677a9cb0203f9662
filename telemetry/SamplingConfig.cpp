/**
 * @file telemetry/SamplingConfig.cpp
 */
#include "SamplingConfig.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace SkillRuntime::Telemetry {
namespace {

bool valid_rate(double rate) {
    return rate >= 0.0 && rate <= 1.0;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // anonymous namespace

SamplingConfig::SamplingConfig(std::map<std::string, double> rules, double default_rate)
    : rules_(std::move(rules))
    , default_rate_(default_rate)
{
    if (!valid_rate(default_rate_)) {
        throw std::invalid_argument("default sample rate must be between 0 and 1");
    }
    for (const auto& [prefix, rate] : rules_) {
        if (is_blank(prefix)) {
            throw std::invalid_argument("sampling rule names cannot be blank");
        }
        if (!valid_rate(rate)) {
            throw std::invalid_argument("sampling rule for '" + prefix + "' must be between 0 and 1");
        }
    }
}

double SamplingConfig::rate_for(const std::string& event) const {
    const std::string* best = nullptr;
    double rate = default_rate_;
    for (const auto& [prefix, rule_rate] : rules_) {
        if (event.compare(0, prefix.size(), prefix) == 0 &&
            (best == nullptr || prefix.size() > best->size())) {
            best = &prefix;
            rate = rule_rate;
        }
    }
    return rate;
}

bool SamplingConfig::should_sample(const std::string& event, std::mt19937_64& rng) const {
    const double rate = rate_for(event);
    if (rate <= 0.0) {
        return false;
    }
    if (rate >= 1.0) {
        return true;
    }
    std::uniform_real_distribution<double> draw(0.0, 1.0);
    return draw(rng) < rate;
}

} // namespace SkillRuntime::Telemetry
