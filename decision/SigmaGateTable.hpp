/**
 * @file decision/SigmaGateTable.hpp
 * @brief Per-skill confidence thresholds.
 */
#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace SkillRuntime::Decision {

/// Threshold for skills without an entry.
inline constexpr double DEFAULT_SIGMA_GATE = 0.5;

/// Skill ids starting with this marker are health (regulated) skills.
inline constexpr const char* HEALTH_SKILL_PREFIX = "hc_";

[[nodiscard]] bool is_health_skill(const std::string& skill_id);

/**
 * @brief Thread-safe skill id -> sigma gate table.
 *
 * Starts with the tuned health gates (hc_gait_guard 0.82, hc_med_sentinel
 * 0.88, hc_sun_hydro 0.78); entries can be added or overridden from config.
 */
class SigmaGateTable {
public:
    SigmaGateTable();

    [[nodiscard]] bool has_gate(const std::string& skill_id) const;

    /// @brief Explicit gate, if any.
    [[nodiscard]] std::optional<double> find_gate(const std::string& skill_id) const;

    /// @brief Explicit gate or DEFAULT_SIGMA_GATE.
    [[nodiscard]] double gate_for(const std::string& skill_id) const;

    /// @throws std::invalid_argument if @p gate is outside [0, 1].
    void set_gate(const std::string& skill_id, double gate);

    [[nodiscard]] std::map<std::string, double> gates() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, double> gates_;
};

} // namespace SkillRuntime::Decision
