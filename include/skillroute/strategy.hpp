#pragma once

#include "skillroute/types.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace skillroute {

// Deterministic tie-break shared by all strategies: highest proficiency on
// the primary required skill, then lowest load, then earliest updated_at,
// then agent id.
bool tie_break_before(const AgentMatchScore& a, const AgentMatchScore& b);

// Abstract candidate selection policy
class SelectionStrategy {
public:
    virtual ~SelectionStrategy() = default;

    // Given qualified candidates, return them in the order the dispatch
    // engine should try to claim them.
    virtual std::vector<AgentMatchScore> rank(
        const std::vector<AgentMatchScore>& candidates) const = 0;

    virtual std::string name() const = 0;
};

// Highest total score first (default)
class BestMatchStrategy : public SelectionStrategy {
public:
    std::vector<AgentMatchScore> rank(
        const std::vector<AgentMatchScore>& candidates) const override;
    std::string name() const override { return "best_match"; }
};

// Fewest current tasks first, then score
class LeastOccupiedStrategy : public SelectionStrategy {
public:
    std::vector<AgentMatchScore> rank(
        const std::vector<AgentMatchScore>& candidates) const override;
    std::string name() const override { return "least_occupied"; }
};

// Skill score first; scores within 10 points count as equal and fall back
// to load
class SkillsFirstStrategy : public SelectionStrategy {
public:
    std::vector<AgentMatchScore> rank(
        const std::vector<AgentMatchScore>& candidates) const override;
    std::string name() const override { return "skills_first"; }
};

// Least recently updated worker first
class LongestIdleStrategy : public SelectionStrategy {
public:
    std::vector<AgentMatchScore> rank(
        const std::vector<AgentMatchScore>& candidates) const override;
    std::string name() const override { return "longest_idle"; }
};

// Rotates the starting point across calls over candidates ordered by id
class RoundRobinStrategy : public SelectionStrategy {
public:
    std::vector<AgentMatchScore> rank(
        const std::vector<AgentMatchScore>& candidates) const override;
    std::string name() const override { return "round_robin"; }

private:
    mutable std::atomic<std::uint64_t> cursor_{0};
};

std::unique_ptr<SelectionStrategy> make_strategy(RoutingStrategy strategy);

} // namespace skillroute
