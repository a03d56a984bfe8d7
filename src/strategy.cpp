#include "skillroute/strategy.hpp"

#include <algorithm>
#include <cmath>

namespace skillroute {

bool tie_break_before(const AgentMatchScore& a, const AgentMatchScore& b) {
    if (a.primary_proficiency != b.primary_proficiency) {
        return a.primary_proficiency > b.primary_proficiency;
    }
    if (a.current_task_count != b.current_task_count) {
        return a.current_task_count < b.current_task_count;
    }
    if (a.updated_at != b.updated_at) {
        return a.updated_at < b.updated_at;
    }
    return a.agent_id < b.agent_id;
}

// ========== BestMatchStrategy ==========

std::vector<AgentMatchScore> BestMatchStrategy::rank(
    const std::vector<AgentMatchScore>& candidates) const
{
    auto result = candidates;
    std::stable_sort(result.begin(), result.end(),
        [](const AgentMatchScore& a, const AgentMatchScore& b) {
            if (a.total_score != b.total_score) return a.total_score > b.total_score;
            return tie_break_before(a, b);
        });
    return result;
}

// ========== LeastOccupiedStrategy ==========

std::vector<AgentMatchScore> LeastOccupiedStrategy::rank(
    const std::vector<AgentMatchScore>& candidates) const
{
    auto result = candidates;
    std::stable_sort(result.begin(), result.end(),
        [](const AgentMatchScore& a, const AgentMatchScore& b) {
            if (a.current_task_count != b.current_task_count) {
                return a.current_task_count < b.current_task_count;
            }
            if (a.total_score != b.total_score) return a.total_score > b.total_score;
            return tie_break_before(a, b);
        });
    return result;
}

// ========== SkillsFirstStrategy ==========

std::vector<AgentMatchScore> SkillsFirstStrategy::rank(
    const std::vector<AgentMatchScore>& candidates) const
{
    // Bucket skill scores so the comparator stays a strict weak ordering
    auto bucket = [](double skill_score) {
        return static_cast<long>(std::floor(skill_score / 10.0));
    };

    auto result = candidates;
    std::stable_sort(result.begin(), result.end(),
        [&bucket](const AgentMatchScore& a, const AgentMatchScore& b) {
            auto ba = bucket(a.skill_score);
            auto bb = bucket(b.skill_score);
            if (ba != bb) return ba > bb;
            if (a.current_task_count != b.current_task_count) {
                return a.current_task_count < b.current_task_count;
            }
            return tie_break_before(a, b);
        });
    return result;
}

// ========== LongestIdleStrategy ==========

std::vector<AgentMatchScore> LongestIdleStrategy::rank(
    const std::vector<AgentMatchScore>& candidates) const
{
    auto result = candidates;
    std::stable_sort(result.begin(), result.end(),
        [](const AgentMatchScore& a, const AgentMatchScore& b) {
            if (a.updated_at != b.updated_at) return a.updated_at < b.updated_at;
            return tie_break_before(a, b);
        });
    return result;
}

// ========== RoundRobinStrategy ==========

std::vector<AgentMatchScore> RoundRobinStrategy::rank(
    const std::vector<AgentMatchScore>& candidates) const
{
    auto result = candidates;
    if (result.empty()) return result;

    std::sort(result.begin(), result.end(),
        [](const AgentMatchScore& a, const AgentMatchScore& b) {
            return a.agent_id < b.agent_id;
        });
    auto offset = cursor_.fetch_add(1) % result.size();
    std::rotate(result.begin(), result.begin() + static_cast<std::ptrdiff_t>(offset),
                result.end());
    return result;
}

std::unique_ptr<SelectionStrategy> make_strategy(RoutingStrategy strategy) {
    switch (strategy) {
        case RoutingStrategy::BestMatch:     return std::make_unique<BestMatchStrategy>();
        case RoutingStrategy::LeastOccupied: return std::make_unique<LeastOccupiedStrategy>();
        case RoutingStrategy::SkillsFirst:   return std::make_unique<SkillsFirstStrategy>();
        case RoutingStrategy::LongestIdle:   return std::make_unique<LongestIdleStrategy>();
        case RoutingStrategy::RoundRobin:    return std::make_unique<RoundRobinStrategy>();
    }
    return std::make_unique<BestMatchStrategy>();
}

} // namespace skillroute
