#pragma once

#include "skillroute/types.hpp"
#include "skillroute/triage.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace skillroute {

// Additive scoring weights used by the dispatch engine
struct ScoringWeights {
    // Awarded once a worker satisfies every required skill
    double required_skill_base = 50.0;

    // Per proficiency step above the minimum, per required skill
    double proficiency_step_bonus = 5.0;

    // Per preferred skill the worker holds at the requested level
    double preferred_skill_bonus = 10.0;

    double preferred_agent_bonus = 20.0;
    double preferred_language_bonus = 5.0;

    // Scaled by current_task_count / max_concurrent_tasks
    double load_penalty = 20.0;
};

struct MatchThresholds {
    double minimum_match_score = 30.0;

    // Workers are eligible while current < max * ratio
    double max_concurrent_task_ratio = 1.0;
};

struct QueueConfig {
    std::string default_queue_id = "default";

    // Linear wait estimator: queue length * this value
    std::int64_t average_handling_seconds = 120;

    // Capacity per queue
    std::size_t max_queue_size = 10000;
};

struct FeatureFlags {
    // A parent skill registered via register_skill_hierarchy satisfies the child
    bool enable_skill_inheritance = true;

    // Reassign relaxation lowers each required proficiency by one level
    bool allow_proficiency_downgrade = true;

    // Reassign relaxation drops the team filter
    bool enable_cross_team_reassign = true;
};

struct RoutingConfig {
    RoutingStrategy default_strategy = RoutingStrategy::BestMatch;

    // Used when no routing rule matches the request
    FallbackBehavior default_fallback = FallbackBehavior::Queue;

    ScoringWeights weights;
    MatchThresholds thresholds;
    QueueConfig queue;
    FeatureFlags features;
};

// Mapping tables used to turn a triage result into a routing request
struct TriageRoutingConfig {
    std::map<UrgencyLevel, Priority> urgency_priority = {
        {UrgencyLevel::Critical, PRIORITY_CRITICAL},
        {UrgencyLevel::High,     PRIORITY_HIGH},
        {UrgencyLevel::Normal,   PRIORITY_NORMAL},
        {UrgencyLevel::Low,      PRIORITY_LOW},
    };

    std::map<LeadScore, Priority> lead_score_boost = {
        {LeadScore::Hot,         15},
        {LeadScore::Warm,        5},
        {LeadScore::Cold,        0},
        {LeadScore::Unqualified, 0},
    };

    // Keys are lowercase procedure names; the first skill is the primary one
    std::map<std::string, std::vector<SkillId>> procedure_skills = {
        {"all-on-x",      {"procedure:all-on-x", "procedure:implants"}},
        {"implant",       {"procedure:implants"}},
        {"implants",      {"procedure:implants"}},
        {"orthodontics",  {"procedure:orthodontics"}},
        {"whitening",     {"procedure:cosmetic"}},
        {"veneers",       {"procedure:cosmetic"}},
        {"cleaning",      {"procedure:general-dentistry"}},
        {"general",       {"procedure:general-dentistry"}},
    };

    std::map<std::string, std::int64_t> sla_minutes = {
        {"next_available_slot", 15},
        {"same_day",            60},
        {"next_business_day",   480},
        {"nurture_sequence",    1440},
    };

    // Used for unrecognized routing recommendations
    std::int64_t default_sla_minutes = 60;

    ProficiencyLevel default_procedure_proficiency = ProficiencyLevel::Intermediate;

    SkillId vip_skill_id = "customer_service:vip";
    SkillId escalation_skill_id = "customer_service:escalations";

    // false: VIP handling is a preferred skill
    bool vip_skill_required = false;

    bool use_suggested_owner_as_preference = true;
};

} // namespace skillroute
