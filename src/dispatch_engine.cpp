#include "skillroute/dispatch_engine.hpp"
#include "skillroute/exceptions.hpp"

#include <algorithm>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace skillroute {

namespace {

std::string format_points(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

// Appends `req`, or raises the minimum of an existing entry for the same skill
void merge_requirement(std::vector<SkillRequirement>& list, const SkillRequirement& req) {
    auto it = std::find_if(list.begin(), list.end(),
        [&](const SkillRequirement& r) { return r.skill_id == req.skill_id; });
    if (it == list.end()) {
        list.push_back(req);
    } else if (req.minimum_proficiency > it->minimum_proficiency) {
        it->minimum_proficiency = req.minimum_proficiency;
    }
}

ProficiencyLevel one_level_lower(ProficiencyLevel level) {
    int lowered = std::max(weight(ProficiencyLevel::Basic), weight(level) - 1);
    return static_cast<ProficiencyLevel>(lowered);
}

std::string describe_shortfall(const std::vector<AgentMatchScore>& scored,
                               const std::vector<AgentMatchScore>& qualified,
                               double minimum_score) {
    if (scored.empty()) return "no eligible agent";
    if (qualified.empty()) {
        return "no agent reached minimum score " + format_points(minimum_score);
    }
    return "all qualified agents reached capacity";
}

} // anonymous namespace

DispatchEngine::DispatchEngine(std::shared_ptr<AgentDirectory> agents,
                               std::shared_ptr<RuleStore> rules,
                               std::shared_ptr<TaskQueueManager> queue,
                               RoutingConfig config)
    : agents_(std::move(agents))
    , rules_(std::move(rules))
    , queue_(std::move(queue))
    , config_(std::move(config))
{
    if (!agents_) throw MissingCollaboratorException("agent directory");
    if (!rules_) throw MissingCollaboratorException("rule store");
    if (!queue_) throw MissingCollaboratorException("task queue manager");

    for (auto s : {RoutingStrategy::BestMatch, RoutingStrategy::LeastOccupied,
                   RoutingStrategy::SkillsFirst, RoutingStrategy::LongestIdle,
                   RoutingStrategy::RoundRobin}) {
        strategies_[s] = make_strategy(s);
    }
}

// ==================== Routing ====================

RoutingDecision DispatchEngine::route(const RoutingContext& context) {
    auto decision = new_decision(context.task_id);
    emit_event(EventType::RouteRequested, "Routing requested",
               decision.id, decision.task_id);

    auto p = plan(decision, context);

    decision.candidates = evaluate(p.effective);
    auto eligible = qualified(decision.candidates);
    if (auto winner = claim(rank(decision.strategy, eligible), decision)) {
        assign(decision, *winner, p.preamble);
        withdraw_queued(decision);
        return decision;
    }

    std::string reason = p.preamble + "; " +
        describe_shortfall(decision.candidates, eligible,
                           config_.thresholds.minimum_match_score);

    decision.fallback_used = p.fallback;
    decision.fallbacks_attempted = 1;

    switch (p.fallback) {
        case FallbackBehavior::Queue:
            enqueue(decision, context, reason);
            break;

        case FallbackBehavior::Escalate:
            escalate(decision, reason);
            break;

        case FallbackBehavior::Reassign: {
            emit_event(EventType::ReassignAttempted, "Retrying with relaxed constraints",
                       decision.id, decision.task_id);

            auto retry = evaluate(relax(p.effective));
            auto retry_eligible = qualified(retry);
            if (auto winner = claim(rank(decision.strategy, retry_eligible), decision)) {
                decision.candidates = std::move(retry);
                assign(decision, *winner, reason + ", reassigned with relaxed constraints");
                withdraw_queued(decision);
            } else {
                decision.fallbacks_attempted++;
                enqueue(decision, context, reason + ", relaxed retry found no agent");
            }
            break;
        }
    }

    return decision;
}

std::vector<RoutingDecision> DispatchEngine::resume_queued(const QueueId& queue_id) {
    std::vector<RoutingDecision> resumed;

    while (auto head = queue_->peek(queue_id)) {
        auto decision = new_decision(head->task_id);
        auto p = plan(decision, head->context);

        decision.candidates = evaluate(p.effective);
        auto winner = claim(rank(decision.strategy, qualified(decision.candidates)), decision);
        if (!winner) break;

        if (!queue_->remove(head->task_id)) {
            // Cancelled or resumed elsewhere since peek
            agents_->release_task_slot(winner->agent_id);
            continue;
        }

        assign(decision, *winner, p.preamble + ", resumed from queue " + queue_id);
        emit_event(EventType::TaskResumed, "Queued task assigned",
                   decision.id, decision.task_id, winner->agent_id, queue_id,
                   std::nullopt, std::nullopt, queue_->length(queue_id));
        resumed.push_back(std::move(decision));
    }

    return resumed;
}

bool DispatchEngine::cancel(const TaskId& task_id) {
    auto queue_id = queue_->queue_of(task_id);
    auto queued = queue_->position(task_id);
    if (!queue_id || !queue_->remove(task_id)) return false;

    auto length = queue_->length(*queue_id);
    emit_event(EventType::TaskCancelled,
               "Removed from position " + std::to_string(queued.value_or(0)),
               std::nullopt, task_id, std::nullopt, queue_id,
               std::nullopt, std::nullopt, length);
    emit_event(EventType::QueueSizeChanged, "Queue shrank after cancellation",
               std::nullopt, std::nullopt, std::nullopt, queue_id,
               std::nullopt, std::nullopt, length);
    return true;
}

void DispatchEngine::release(const AgentId& agent_id) {
    agents_->release_task_slot(agent_id);
    emit_event(EventType::TaskReleased, "Task slot released",
               std::nullopt, std::nullopt, agent_id);
}

// ==================== Queries ====================

std::vector<AgentProfile> DispatchEngine::available_agents(
    const std::optional<TeamId>& team_id) const
{
    return agents_->available(team_id);
}

AgentMatchCheck DispatchEngine::check_agent_match(const AgentId& agent_id,
                                                  const RoutingContext& context) const
{
    AgentMatchCheck result;
    auto agent = agents_->by_id(agent_id);
    if (!agent) return result;

    std::map<SkillId, std::vector<SkillId>> hierarchy;
    if (config_.features.enable_skill_inheritance) {
        std::shared_lock lock(hierarchy_mutex_);
        hierarchy = skill_hierarchy_;
    }

    for (const auto& req : context.required_skills) {
        auto level = effective_proficiency(*agent, req.skill_id, hierarchy);
        if (!level || *level < req.minimum_proficiency) {
            result.missing_skills.push_back(req.skill_id);
        }
    }
    result.matches = result.missing_skills.empty();
    return result;
}

const RoutingConfig& DispatchEngine::config() const noexcept {
    return config_;
}

// ==================== Configuration ====================

void DispatchEngine::register_skill_hierarchy(const SkillId& skill_id,
                                              std::vector<SkillId> parent_ids) {
    std::unique_lock lock(hierarchy_mutex_);
    skill_hierarchy_[skill_id] = std::move(parent_ids);
}

void DispatchEngine::clear_skill_hierarchy() {
    std::unique_lock lock(hierarchy_mutex_);
    skill_hierarchy_.clear();
}

void DispatchEngine::set_selection_strategy(RoutingStrategy strategy,
                                            std::unique_ptr<SelectionStrategy> impl) {
    if (!impl) throw MissingCollaboratorException("selection strategy");
    std::unique_lock lock(strategies_mutex_);
    strategies_[strategy] = std::shared_ptr<SelectionStrategy>(std::move(impl));
}

void DispatchEngine::set_monitor(std::shared_ptr<Monitor> monitor) {
    monitor_ = std::move(monitor);
}

// ==================== Internal Helpers ====================

DispatchEngine::Plan DispatchEngine::plan(RoutingDecision& decision,
                                          const RoutingContext& context) {
    Plan p;
    auto rule = find_applicable_rule(context);

    if (rule) {
        p.effective = merge_rule(context, *rule);
        p.fallback = rule->routing.fallback_behavior;
        p.preamble = "rule '" + rule->name + "' (" + rule->id + ")";
        decision.applied_rule_id = rule->id;
        decision.applied_rule_name = rule->name;
        decision.strategy = rule->routing.strategy;
        emit_event(EventType::RuleMatched, "Rule matched: " + rule->name,
                   decision.id, decision.task_id, std::nullopt, std::nullopt, rule->id);
    } else {
        p.effective = context;
        p.fallback = config_.default_fallback;
        p.preamble = "no matching rule";
        decision.strategy = config_.default_strategy;
        emit_event(EventType::NoRuleMatched, "Using default strategy",
                   decision.id, decision.task_id);
    }

    p.preamble += ", strategy " + std::string(to_string(decision.strategy));
    return p;
}

std::optional<RoutingRule> DispatchEngine::find_applicable_rule(
    const RoutingContext& context) const
{
    RuleConditions query;
    if (context.procedure_type) {
        query.procedure_types = std::vector<std::string>{*context.procedure_type};
    }
    if (context.urgency_level) {
        query.urgency_levels = std::vector<UrgencyLevel>{*context.urgency_level};
    }
    if (context.channel) {
        query.channels = std::vector<Channel>{*context.channel};
    }
    if (context.lead_score) {
        query.lead_scores = std::vector<LeadScore>{*context.lead_score};
    }
    query.is_vip = context.is_vip;
    query.is_existing_patient = context.is_existing_patient;

    auto rules = rules_->matching(query, context.requested_at.value_or(WallClock::now()));
    if (rules.empty()) return std::nullopt;
    return rules.front();
}

RoutingContext DispatchEngine::merge_rule(const RoutingContext& context,
                                          const RoutingRule& rule) {
    RoutingContext merged = context;
    for (const auto& req : rule.routing.skill_requirements) {
        if (req.kind == RequirementKind::Required) {
            merge_requirement(merged.required_skills, req);
        } else {
            merge_requirement(merged.preferred_skills, req);
        }
    }
    return merged;
}

RoutingContext DispatchEngine::relax(const RoutingContext& context) const {
    RoutingContext relaxed = context;

    if (config_.features.enable_cross_team_reassign) {
        relaxed.team_id.reset();
    }
    if (config_.features.allow_proficiency_downgrade) {
        for (auto& req : relaxed.required_skills) {
            req.minimum_proficiency = one_level_lower(req.minimum_proficiency);
        }
    }
    if (relaxed.required_language) {
        if (!contains(relaxed.preferred_languages, *relaxed.required_language)) {
            relaxed.preferred_languages.push_back(*relaxed.required_language);
        }
        relaxed.required_language.reset();
    }
    return relaxed;
}

std::vector<AgentMatchScore> DispatchEngine::evaluate(const RoutingContext& context) const {
    std::map<SkillId, std::vector<SkillId>> hierarchy;
    if (config_.features.enable_skill_inheritance) {
        std::shared_lock lock(hierarchy_mutex_);
        hierarchy = skill_hierarchy_;
    }

    const auto& w = config_.weights;
    std::vector<AgentMatchScore> scored;

    for (const auto& agent : agents_->available(context.team_id)) {
        if (contains(context.exclude_agent_ids, agent.id)) continue;
        if (!agent.has_capacity(config_.thresholds.max_concurrent_task_ratio)) continue;
        if (context.required_language && !agent.speaks(*context.required_language)) continue;

        AgentMatchScore score;
        score.agent_id = agent.id;
        score.agent_name = agent.name;
        score.current_task_count = agent.current_task_count;
        score.updated_at = agent.updated_at;

        // Required skills gate eligibility
        bool eligible = true;
        double step_bonus = 0.0;
        std::vector<std::string> step_factors;
        for (std::size_t i = 0; i < context.required_skills.size(); ++i) {
            const auto& req = context.required_skills[i];
            auto level = effective_proficiency(agent, req.skill_id, hierarchy);
            if (!level || *level < req.minimum_proficiency) {
                eligible = false;
                break;
            }
            if (i == 0) score.primary_proficiency = *level;

            int steps = weight(*level) - weight(req.minimum_proficiency);
            if (steps > 0) {
                double bonus = steps * w.proficiency_step_bonus;
                step_bonus += bonus;
                step_factors.push_back(req.skill_id + " " + to_string(*level) +
                                       " (+" + format_points(bonus) + ")");
            }
        }
        if (!eligible) continue;

        score.skill_score = w.required_skill_base + step_bonus;
        score.factors.push_back("meets " + std::to_string(context.required_skills.size()) +
                                " required skills (+" + format_points(w.required_skill_base) + ")");
        score.factors.insert(score.factors.end(), step_factors.begin(), step_factors.end());

        // Preferences only add points
        for (const auto& pref : context.preferred_skills) {
            auto level = effective_proficiency(agent, pref.skill_id, hierarchy);
            if (level && *level >= pref.minimum_proficiency) {
                score.preference_score += w.preferred_skill_bonus;
                score.factors.push_back("preferred skill " + pref.skill_id +
                                        " (+" + format_points(w.preferred_skill_bonus) + ")");
            }
        }
        if (contains(context.prefer_agent_ids, agent.id)) {
            score.preference_score += w.preferred_agent_bonus;
            score.factors.push_back("preferred agent (+" +
                                    format_points(w.preferred_agent_bonus) + ")");
        }
        for (const auto& language : context.preferred_languages) {
            if (agent.speaks(language)) {
                score.preference_score += w.preferred_language_bonus;
                score.factors.push_back("speaks " + language + " (+" +
                                        format_points(w.preferred_language_bonus) + ")");
                break;
            }
        }

        score.load_penalty = w.load_penalty * agent.load_ratio();
        if (score.load_penalty > 0.0) {
            score.factors.push_back("load " + std::to_string(agent.current_task_count) + "/" +
                                    std::to_string(agent.max_concurrent_tasks) +
                                    " (-" + format_points(score.load_penalty) + ")");
        }

        score.total_score = score.skill_score + score.preference_score - score.load_penalty;
        scored.push_back(std::move(score));
    }

    return scored;
}

std::vector<AgentMatchScore> DispatchEngine::qualified(
    const std::vector<AgentMatchScore>& scored) const
{
    std::vector<AgentMatchScore> result;
    for (const auto& s : scored) {
        if (s.total_score >= config_.thresholds.minimum_match_score) {
            result.push_back(s);
        }
    }
    return result;
}

std::vector<AgentMatchScore> DispatchEngine::rank(
    RoutingStrategy strategy,
    const std::vector<AgentMatchScore>& candidates) const
{
    if (candidates.empty()) return {};

    std::shared_ptr<SelectionStrategy> impl;
    {
        std::shared_lock lock(strategies_mutex_);
        auto it = strategies_.find(strategy);
        if (it != strategies_.end()) impl = it->second;
    }
    if (!impl) impl = make_strategy(strategy);
    return impl->rank(candidates);
}

std::optional<AgentMatchScore> DispatchEngine::claim(
    const std::vector<AgentMatchScore>& ranked,
    const RoutingDecision& decision)
{
    for (const auto& candidate : ranked) {
        if (agents_->try_acquire_task_slot(candidate.agent_id,
                                           config_.thresholds.max_concurrent_task_ratio)) {
            return candidate;
        }
        emit_event(EventType::CapacityRaceLost, "Agent filled before claim",
                   decision.id, decision.task_id, candidate.agent_id);
    }
    return std::nullopt;
}

std::optional<ProficiencyLevel> DispatchEngine::effective_proficiency(
    const AgentProfile& agent, const SkillId& skill_id,
    const std::map<SkillId, std::vector<SkillId>>& hierarchy) const
{
    std::optional<ProficiencyLevel> best;
    if (const auto* own = agent.find_skill(skill_id)) {
        best = own->proficiency;
    }

    auto it = hierarchy.find(skill_id);
    if (it == hierarchy.end()) return best;

    for (const auto& parent : it->second) {
        if (const auto* inherited = agent.find_skill(parent)) {
            if (!best || inherited->proficiency > *best) {
                best = inherited->proficiency;
            }
        }
    }
    return best;
}

void DispatchEngine::assign(RoutingDecision& decision, const AgentMatchScore& winner,
                            const std::string& preamble) {
    decision.outcome = RoutingOutcome::Assigned;
    decision.selected_agent_id = winner.agent_id;
    decision.match_score = winner.total_score;

    std::string factors;
    for (const auto& f : winner.factors) {
        if (!factors.empty()) factors += ", ";
        factors += f;
    }
    decision.reasoning = preamble + "; selected " + winner.agent_name + " (" +
                         winner.agent_id + ") score " + format_points(winner.total_score);
    if (!factors.empty()) decision.reasoning += ": " + factors;

    emit_event(EventType::TaskAssigned, decision.reasoning,
               decision.id, decision.task_id, winner.agent_id, std::nullopt,
               decision.applied_rule_id, winner.total_score);
}

// A task routed again while still queued is now held by a worker, so its
// queue entry must not be resumed a second time.
void DispatchEngine::withdraw_queued(const RoutingDecision& decision) {
    auto queue_id = queue_->queue_of(decision.task_id);
    if (!queue_id || !queue_->remove(decision.task_id)) return;

    emit_event(EventType::QueueSizeChanged, "Queued entry superseded by direct assignment",
               decision.id, decision.task_id, decision.selected_agent_id, queue_id,
               std::nullopt, std::nullopt, queue_->length(*queue_id));
}

void DispatchEngine::enqueue(RoutingDecision& decision, const RoutingContext& context,
                             const std::string& preamble) {
    try {
        auto placed = queue_->enqueue(decision.task_id, context, context.priority);
        decision.outcome = RoutingOutcome::Queued;
        decision.queue_id = placed.queue_id;
        decision.queue_position = placed.position;
        decision.estimated_wait_seconds = queue_->estimated_wait_seconds(placed.queue_id);
        decision.reasoning = preamble + "; queued in " + placed.queue_id +
                             " at position " + std::to_string(placed.position);

        emit_event(EventType::TaskQueued, decision.reasoning,
                   decision.id, decision.task_id, std::nullopt, placed.queue_id,
                   decision.applied_rule_id, std::nullopt, queue_->length(placed.queue_id));
    } catch (const QueueFullException& e) {
        emit_event(EventType::QueueFull, e.what(),
                   decision.id, decision.task_id, std::nullopt, e.queue_id());
        decision.fallbacks_attempted++;
        escalate(decision, preamble + "; " + e.what());
    }
}

void DispatchEngine::escalate(RoutingDecision& decision, const std::string& reason) {
    decision.outcome = RoutingOutcome::Escalated;
    decision.selected_agent_id.reset();
    decision.match_score = 0.0;
    decision.reasoning = reason + "; escalated";

    emit_event(EventType::TaskEscalated, decision.reasoning,
               decision.id, decision.task_id, std::nullopt, std::nullopt,
               decision.applied_rule_id);
}

RoutingDecision DispatchEngine::new_decision(const TaskId& task_id) {
    RoutingDecision decision;
    decision.id = next_decision_id_.fetch_add(1);
    decision.timestamp = Clock::now();
    decision.task_id = task_id.empty() ? "task-" + std::to_string(decision.id) : task_id;
    return decision;
}

void DispatchEngine::emit_event(EventType type, const std::string& message,
                                std::optional<DecisionId> decision_id,
                                std::optional<TaskId> task_id,
                                std::optional<AgentId> agent_id,
                                std::optional<QueueId> queue_id,
                                std::optional<RuleId> rule_id,
                                std::optional<double> score,
                                std::optional<std::size_t> queue_length) {
    if (!monitor_) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.decision_id = decision_id;
    event.task_id = std::move(task_id);
    event.agent_id = std::move(agent_id);
    event.queue_id = std::move(queue_id);
    event.rule_id = std::move(rule_id);
    event.score = score;
    event.queue_length = queue_length;

    monitor_->on_event(event);
}

} // namespace skillroute
