#pragma once

#include "skillroute/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace skillroute {

struct AgentSkill {
    SkillId          skill_id;
    ProficiencyLevel proficiency{ProficiencyLevel::Basic};
    bool             active{true};
};

// Worker profile. Owned by the AgentDirectory; callers hold copies.
struct AgentProfile {
    AgentId                  id;
    std::string              name;
    std::string              email;
    std::string              phone;
    std::string              role{"agent"};
    Availability             availability{Availability::Offline};
    std::vector<AgentSkill>  skills;
    std::vector<std::string> languages;
    std::int32_t             current_task_count{0};
    std::int32_t             max_concurrent_tasks{1};
    std::optional<TeamId>    team_id;
    Timestamp                created_at{};
    Timestamp                updated_at{};

    // Strongest active entry for skill_id, or nullptr. Inactive entries are invisible.
    const AgentSkill* find_skill(const SkillId& skill_id) const;

    bool has_skill(const SkillId& skill_id,
                   ProficiencyLevel minimum = ProficiencyLevel::Basic) const;

    bool speaks(const std::string& language) const;

    // current_task_count / max_concurrent_tasks
    double load_ratio() const noexcept;

    bool is_available() const noexcept;

    // Available and below max_concurrent_tasks * ratio
    bool has_capacity(double ratio = 1.0) const noexcept;
};

} // namespace skillroute
