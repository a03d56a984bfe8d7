#include "skillroute/agent.hpp"

#include <algorithm>

namespace skillroute {

const AgentSkill* AgentProfile::find_skill(const SkillId& skill_id) const {
    const AgentSkill* best = nullptr;
    for (auto& s : skills) {
        if (!s.active || s.skill_id != skill_id) continue;
        if (best == nullptr || s.proficiency > best->proficiency) {
            best = &s;
        }
    }
    return best;
}

bool AgentProfile::has_skill(const SkillId& skill_id, ProficiencyLevel minimum) const {
    // A worker may list the same skill more than once; any qualifying entry counts
    return std::any_of(skills.begin(), skills.end(),
        [&](const AgentSkill& s) {
            return s.active && s.skill_id == skill_id && s.proficiency >= minimum;
        });
}

bool AgentProfile::speaks(const std::string& language) const {
    return std::find(languages.begin(), languages.end(), language) != languages.end();
}

double AgentProfile::load_ratio() const noexcept {
    if (max_concurrent_tasks <= 0) return 1.0;
    return static_cast<double>(current_task_count) / max_concurrent_tasks;
}

bool AgentProfile::is_available() const noexcept {
    return availability == Availability::Available;
}

bool AgentProfile::has_capacity(double ratio) const noexcept {
    if (!is_available()) return false;
    if (current_task_count >= max_concurrent_tasks) return false;
    return current_task_count < max_concurrent_tasks * ratio;
}

} // namespace skillroute
