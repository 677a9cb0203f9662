/**
 * @file decision/SigmaGateTable.cpp
 */
#include "SigmaGateTable.hpp"

#include <stdexcept>

namespace SkillRuntime::Decision {

bool is_health_skill(const std::string& skill_id) {
    return skill_id.rfind(HEALTH_SKILL_PREFIX, 0) == 0;
}

SigmaGateTable::SigmaGateTable()
    : gates_{
        {"hc_gait_guard", 0.82},
        {"hc_med_sentinel", 0.88},
        {"hc_sun_hydro", 0.78},
    }
{
}

bool SigmaGateTable::has_gate(const std::string& skill_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gates_.count(skill_id) > 0;
}

std::optional<double> SigmaGateTable::find_gate(const std::string& skill_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gates_.find(skill_id);
    if (it == gates_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double SigmaGateTable::gate_for(const std::string& skill_id) const {
    return find_gate(skill_id).value_or(DEFAULT_SIGMA_GATE);
}

void SigmaGateTable::set_gate(const std::string& skill_id, double gate) {
    if (!(gate >= 0.0 && gate <= 1.0)) {
        throw std::invalid_argument("sigma gate for '" + skill_id + "' must be between 0 and 1");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    gates_[skill_id] = gate;
}

std::map<std::string, double> SigmaGateTable::gates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gates_;
}

} // namespace SkillRuntime::Decision
