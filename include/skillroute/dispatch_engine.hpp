#pragma once

#include "skillroute/types.hpp"
#include "skillroute/agent_directory.hpp"
#include "skillroute/rule_store.hpp"
#include "skillroute/task_queue.hpp"
#include "skillroute/strategy.hpp"
#include "skillroute/monitor.hpp"
#include "skillroute/config.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace skillroute {

struct AgentMatchCheck {
    bool matches{false};
    std::vector<std::string> missing_skills;
};

// Matches routing requests against the agent directory, falling back to the
// rule's queue/reassign/escalate behavior when nobody is eligible.
//
// route() may be called from many threads. Candidate selection and the
// capacity increment are atomic per worker (AgentDirectory::try_acquire_task_slot),
// so no worker is pushed past max_concurrent_tasks. route() never blocks
// waiting for a worker and never throws for routing failures.
class DispatchEngine {
public:
    // Throws MissingCollaboratorException if any component is null.
    DispatchEngine(std::shared_ptr<AgentDirectory> agents,
                   std::shared_ptr<RuleStore> rules,
                   std::shared_ptr<TaskQueueManager> queue,
                   RoutingConfig config = RoutingConfig{});

    DispatchEngine(const DispatchEngine&) = delete;
    DispatchEngine& operator=(const DispatchEngine&) = delete;

    // ==================== Routing ====================

    RoutingDecision route(const RoutingContext& context);

    // Assigns queued tasks from the head of `queue_id` while workers are
    // eligible. Stops at the first task that cannot be placed.
    std::vector<RoutingDecision> resume_queued(const QueueId& queue_id);

    // Cancels a queued task (e.g. the lead withdrew).
    bool cancel(const TaskId& task_id);

    // Marks one task finished for the worker.
    void release(const AgentId& agent_id);

    // ==================== Queries ====================

    // Read-only passthrough for monitoring/UI
    std::vector<AgentProfile> available_agents(
        const std::optional<TeamId>& team_id = std::nullopt) const;

    // Whether the worker holds every required skill of `context`.
    AgentMatchCheck check_agent_match(const AgentId& agent_id,
                                      const RoutingContext& context) const;

    const RoutingConfig& config() const noexcept;

    // ==================== Configuration ====================

    // `skill_id` requirements are also satisfied by any of `parent_ids`.
    void register_skill_hierarchy(const SkillId& skill_id, std::vector<SkillId> parent_ids);
    void clear_skill_hierarchy();

    void set_selection_strategy(RoutingStrategy strategy,
                                std::unique_ptr<SelectionStrategy> impl);

    // Not synchronized with route(); attach before routing starts.
    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    std::shared_ptr<AgentDirectory> agents_;
    std::shared_ptr<RuleStore> rules_;
    std::shared_ptr<TaskQueueManager> queue_;
    RoutingConfig config_;
    std::shared_ptr<Monitor> monitor_;

    mutable std::shared_mutex hierarchy_mutex_;
    std::map<SkillId, std::vector<SkillId>> skill_hierarchy_;

    mutable std::shared_mutex strategies_mutex_;
    std::map<RoutingStrategy, std::shared_ptr<SelectionStrategy>> strategies_;

    std::atomic<DecisionId> next_decision_id_{1};

    // Rule-resolved view of a request
    struct Plan {
        RoutingContext effective;
        FallbackBehavior fallback{FallbackBehavior::Queue};
        std::string preamble;
    };

    // Internal helpers
    Plan plan(RoutingDecision& decision, const RoutingContext& context);
    std::optional<RoutingRule> find_applicable_rule(const RoutingContext& context) const;
    static RoutingContext merge_rule(const RoutingContext& context, const RoutingRule& rule);
    RoutingContext relax(const RoutingContext& context) const;

    std::vector<AgentMatchScore> evaluate(const RoutingContext& context) const;
    std::vector<AgentMatchScore> qualified(const std::vector<AgentMatchScore>& scored) const;
    std::vector<AgentMatchScore> rank(RoutingStrategy strategy,
                                      const std::vector<AgentMatchScore>& candidates) const;
    std::optional<AgentMatchScore> claim(const std::vector<AgentMatchScore>& ranked,
                                         const RoutingDecision& decision);

    std::optional<ProficiencyLevel> effective_proficiency(
        const AgentProfile& agent, const SkillId& skill_id,
        const std::map<SkillId, std::vector<SkillId>>& hierarchy) const;

    void assign(RoutingDecision& decision, const AgentMatchScore& winner,
                const std::string& preamble);
    void withdraw_queued(const RoutingDecision& decision);
    void enqueue(RoutingDecision& decision, const RoutingContext& context,
                 const std::string& preamble);
    void escalate(RoutingDecision& decision, const std::string& reason);

    RoutingDecision new_decision(const TaskId& task_id);

    void emit_event(EventType type, const std::string& message,
                    std::optional<DecisionId> decision_id = std::nullopt,
                    std::optional<TaskId> task_id = std::nullopt,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<QueueId> queue_id = std::nullopt,
                    std::optional<RuleId> rule_id = std::nullopt,
                    std::optional<double> score = std::nullopt,
                    std::optional<std::size_t> queue_length = std::nullopt);
};

} // namespace skillroute
