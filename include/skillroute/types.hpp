#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skillroute {

// Identifiers
using AgentId = std::string;
using SkillId = std::string;
using TeamId = std::string;
using QueueId = std::string;
using TaskId = std::string;
using RuleId = std::string;
using DecisionId = std::uint64_t;

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Wall-clock time, used only for business-hours rule windows
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

// Task priority (higher = served first)
using Priority = std::int32_t;

constexpr Priority PRIORITY_LOW      = 25;
constexpr Priority PRIORITY_NORMAL   = 50;
constexpr Priority PRIORITY_HIGH     = 75;
constexpr Priority PRIORITY_CRITICAL = 100;

// Ordinal skill strength; compares by declaration order.
enum class ProficiencyLevel {
    Basic = 1,
    Intermediate = 2,
    Advanced = 3,
    Expert = 4
};

enum class Availability {
    Available,
    Busy,
    Offline
};

enum class Channel {
    Voice,
    Whatsapp,
    Web,
    Chat
};

enum class UrgencyLevel {
    Low,
    Normal,
    High,
    Critical
};

// Action taken when no eligible worker is found
enum class FallbackBehavior {
    Queue,     // Hold the task in the team (or default) queue
    Reassign,  // Retry once with relaxed constraints, then queue
    Escalate   // Hand off to supervision without assigning
};

enum class RoutingStrategy {
    BestMatch,
    LeastOccupied,
    SkillsFirst,
    LongestIdle,
    RoundRobin
};

enum class RoutingOutcome {
    Assigned,
    Queued,
    Escalated
};

// Lead qualification as scored by the CRM
enum class LeadScore {
    Hot,
    Warm,
    Cold,
    Unqualified
};

enum class RequirementKind {
    Required,
    Preferred
};

struct SkillRequirement {
    SkillId          skill_id;
    ProficiencyLevel minimum_proficiency{ProficiencyLevel::Basic};
    RequirementKind  kind{RequirementKind::Required};
};

// Local-time window. Hours are [start_hour, end_hour); a window whose start
// is after its end wraps past midnight. Days are 0 = Sunday .. 6 = Saturday,
// empty means every day.
struct TimeRange {
    int              start_hour{0};
    int              end_hour{24};
    std::vector<int> days_of_week;
};

// Each dimension is optional; an absent or empty dimension matches anything.
struct RuleConditions {
    std::optional<std::vector<std::string>>  procedure_types;
    std::optional<std::vector<UrgencyLevel>> urgency_levels;
    std::optional<std::vector<Channel>>      channels;
    std::optional<bool>                      is_vip;
    std::optional<bool>                      is_existing_patient;
    std::optional<std::vector<LeadScore>>    lead_scores;

    // Rule side only; ignored on a query
    std::optional<TimeRange>                 time_range;
};

struct RoutingDirective {
    RoutingStrategy               strategy{RoutingStrategy::BestMatch};
    std::vector<SkillRequirement> skill_requirements;
    FallbackBehavior              fallback_behavior{FallbackBehavior::Queue};
    std::int64_t                  max_queue_time_seconds{600};
};

struct RoutingRule {
    RuleId           id;
    std::string      name;
    Priority         priority{0};
    bool             active{true};
    RuleConditions   conditions;
    RoutingDirective routing;
    Timestamp        created_at{};
    Timestamp        updated_at{};
};

// Routing request handed to the dispatch engine
struct RoutingContext {
    TaskId                        task_id;
    std::optional<Channel>        channel;
    std::optional<UrgencyLevel>   urgency_level;
    std::optional<std::string>    procedure_type;
    std::vector<SkillRequirement> required_skills;
    std::vector<SkillRequirement> preferred_skills;
    std::vector<AgentId>          prefer_agent_ids;
    std::vector<AgentId>          exclude_agent_ids;
    std::optional<std::string>    required_language;
    std::vector<std::string>      preferred_languages;
    std::optional<TeamId>         team_id;
    Priority                      priority{PRIORITY_NORMAL};
    std::optional<std::int64_t>   sla_deadline_minutes;
    bool                          is_existing_patient{false};
    bool                          is_vip{false};
    std::optional<LeadScore>      lead_score;
    // Evaluated against rule time windows; unset means now
    std::optional<WallTime>       requested_at;
};

// Per-candidate scoring breakdown
struct AgentMatchScore {
    AgentId          agent_id;
    std::string      agent_name;
    double           total_score{0.0};
    double           skill_score{0.0};
    double           preference_score{0.0};
    double           load_penalty{0.0};
    ProficiencyLevel primary_proficiency{ProficiencyLevel::Basic};
    std::int32_t     current_task_count{0};
    Timestamp        updated_at{};
    std::vector<std::string> factors;
};

struct RoutingDecision {
    DecisionId                    id{0};
    TaskId                        task_id;
    RoutingOutcome                outcome{RoutingOutcome::Escalated};
    std::optional<AgentId>        selected_agent_id;
    double                        match_score{0.0};
    std::string                   reasoning;
    Timestamp                     timestamp{};

    std::optional<RuleId>         applied_rule_id;
    std::optional<std::string>    applied_rule_name;
    RoutingStrategy               strategy{RoutingStrategy::BestMatch};
    std::optional<FallbackBehavior> fallback_used;
    std::size_t                   fallbacks_attempted{0};

    std::optional<QueueId>        queue_id;
    std::optional<std::size_t>    queue_position;
    std::optional<std::int64_t>   estimated_wait_seconds;

    std::vector<AgentMatchScore>  candidates;
};

struct QueuedTask {
    TaskId         task_id;
    Timestamp      enqueued_at{};
    Priority       priority{PRIORITY_NORMAL};
    RoutingContext context;
    QueueId        queue_id;
};

struct EnqueueResult {
    QueueId     queue_id;
    std::size_t position{0};
};

inline int weight(ProficiencyLevel p) {
    return static_cast<int>(p);
}

inline const char* to_string(ProficiencyLevel p) {
    switch (p) {
        case ProficiencyLevel::Basic:        return "basic";
        case ProficiencyLevel::Intermediate: return "intermediate";
        case ProficiencyLevel::Advanced:     return "advanced";
        case ProficiencyLevel::Expert:       return "expert";
    }
    return "unknown";
}

inline const char* to_string(Availability a) {
    switch (a) {
        case Availability::Available: return "available";
        case Availability::Busy:      return "busy";
        case Availability::Offline:   return "offline";
    }
    return "unknown";
}

inline const char* to_string(Channel c) {
    switch (c) {
        case Channel::Voice:    return "voice";
        case Channel::Whatsapp: return "whatsapp";
        case Channel::Web:      return "web";
        case Channel::Chat:     return "chat";
    }
    return "unknown";
}

inline const char* to_string(UrgencyLevel u) {
    switch (u) {
        case UrgencyLevel::Low:      return "low";
        case UrgencyLevel::Normal:   return "normal";
        case UrgencyLevel::High:     return "high";
        case UrgencyLevel::Critical: return "critical";
    }
    return "unknown";
}

inline const char* to_string(FallbackBehavior f) {
    switch (f) {
        case FallbackBehavior::Queue:    return "queue";
        case FallbackBehavior::Reassign: return "reassign";
        case FallbackBehavior::Escalate: return "escalate";
    }
    return "unknown";
}

inline const char* to_string(RoutingStrategy s) {
    switch (s) {
        case RoutingStrategy::BestMatch:     return "best_match";
        case RoutingStrategy::LeastOccupied: return "least_occupied";
        case RoutingStrategy::SkillsFirst:   return "skills_first";
        case RoutingStrategy::LongestIdle:   return "longest_idle";
        case RoutingStrategy::RoundRobin:    return "round_robin";
    }
    return "unknown";
}

inline const char* to_string(LeadScore s) {
    switch (s) {
        case LeadScore::Hot:         return "HOT";
        case LeadScore::Warm:        return "WARM";
        case LeadScore::Cold:        return "COLD";
        case LeadScore::Unqualified: return "UNQUALIFIED";
    }
    return "UNKNOWN";
}

inline const char* to_string(RoutingOutcome o) {
    switch (o) {
        case RoutingOutcome::Assigned:  return "assigned";
        case RoutingOutcome::Queued:    return "queued";
        case RoutingOutcome::Escalated: return "escalated";
    }
    return "unknown";
}

} // namespace skillroute
