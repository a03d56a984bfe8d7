#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <skillroute/skillroute.hpp>

using namespace skillroute;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_skillroute, m) {
    m.doc() = "SkillRoute: Skill-based task routing for clinic CRM teams";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_monitors(m);
    bind_dispatch(m);
    bind_triage(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<ProficiencyLevel>(m, "ProficiencyLevel")
        .value("Basic",        ProficiencyLevel::Basic)
        .value("Intermediate", ProficiencyLevel::Intermediate)
        .value("Advanced",     ProficiencyLevel::Advanced)
        .value("Expert",       ProficiencyLevel::Expert)
        .export_values();

    py::enum_<Availability>(m, "Availability")
        .value("Available", Availability::Available)
        .value("Busy",      Availability::Busy)
        .value("Offline",   Availability::Offline)
        .export_values();

    py::enum_<Channel>(m, "Channel")
        .value("Voice",    Channel::Voice)
        .value("Whatsapp", Channel::Whatsapp)
        .value("Web",      Channel::Web)
        .value("Chat",     Channel::Chat);

    py::enum_<UrgencyLevel>(m, "UrgencyLevel")
        .value("Low",      UrgencyLevel::Low)
        .value("Normal",   UrgencyLevel::Normal)
        .value("High",     UrgencyLevel::High)
        .value("Critical", UrgencyLevel::Critical);

    py::enum_<FallbackBehavior>(m, "FallbackBehavior")
        .value("Queue",    FallbackBehavior::Queue)
        .value("Reassign", FallbackBehavior::Reassign)
        .value("Escalate", FallbackBehavior::Escalate)
        .export_values();

    py::enum_<RoutingStrategy>(m, "RoutingStrategy")
        .value("BestMatch",     RoutingStrategy::BestMatch)
        .value("LeastOccupied", RoutingStrategy::LeastOccupied)
        .value("SkillsFirst",   RoutingStrategy::SkillsFirst)
        .value("LongestIdle",   RoutingStrategy::LongestIdle)
        .value("RoundRobin",    RoutingStrategy::RoundRobin)
        .export_values();

    py::enum_<RoutingOutcome>(m, "RoutingOutcome")
        .value("Assigned",  RoutingOutcome::Assigned)
        .value("Queued",    RoutingOutcome::Queued)
        .value("Escalated", RoutingOutcome::Escalated)
        .export_values();

    py::enum_<LeadScore>(m, "LeadScore")
        .value("Hot",         LeadScore::Hot)
        .value("Warm",        LeadScore::Warm)
        .value("Cold",        LeadScore::Cold)
        .value("Unqualified", LeadScore::Unqualified)
        .export_values();

    py::enum_<RequirementKind>(m, "RequirementKind")
        .value("Required",  RequirementKind::Required)
        .value("Preferred", RequirementKind::Preferred)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("RouteRequested",    EventType::RouteRequested)
        .value("RuleMatched",       EventType::RuleMatched)
        .value("NoRuleMatched",     EventType::NoRuleMatched)
        .value("TaskAssigned",      EventType::TaskAssigned)
        .value("TaskQueued",        EventType::TaskQueued)
        .value("TaskEscalated",     EventType::TaskEscalated)
        .value("ReassignAttempted", EventType::ReassignAttempted)
        .value("CapacityRaceLost",  EventType::CapacityRaceLost)
        .value("QueueFull",         EventType::QueueFull)
        .value("TaskResumed",       EventType::TaskResumed)
        .value("TaskCancelled",     EventType::TaskCancelled)
        .value("TaskReleased",      EventType::TaskReleased)
        .value("QueueSizeChanged",  EventType::QueueSizeChanged)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Structs ----------------------------------------------------------

    py::class_<AgentSkill>(m, "AgentSkill")
        .def(py::init<>())
        .def(py::init([](SkillId id, ProficiencyLevel p, bool active) {
                 return AgentSkill{std::move(id), p, active};
             }),
             py::arg("skill_id"), py::arg("proficiency"), py::arg("active") = true)
        .def_readwrite("skill_id",    &AgentSkill::skill_id)
        .def_readwrite("proficiency", &AgentSkill::proficiency)
        .def_readwrite("active",      &AgentSkill::active);

    py::class_<SkillRequirement>(m, "SkillRequirement")
        .def(py::init<>())
        .def(py::init([](SkillId id, ProficiencyLevel p, RequirementKind k) {
                 return SkillRequirement{std::move(id), p, k};
             }),
             py::arg("skill_id"),
             py::arg("minimum_proficiency") = ProficiencyLevel::Basic,
             py::arg("kind") = RequirementKind::Required)
        .def_readwrite("skill_id",            &SkillRequirement::skill_id)
        .def_readwrite("minimum_proficiency", &SkillRequirement::minimum_proficiency)
        .def_readwrite("kind",                &SkillRequirement::kind);

    py::class_<TimeRange>(m, "TimeRange")
        .def(py::init<>())
        .def(py::init([](int start, int end, std::vector<int> days) {
                 return TimeRange{start, end, std::move(days)};
             }),
             py::arg("start_hour"), py::arg("end_hour"),
             py::arg("days_of_week") = std::vector<int>{})
        .def_readwrite("start_hour",   &TimeRange::start_hour)
        .def_readwrite("end_hour",     &TimeRange::end_hour)
        .def_readwrite("days_of_week", &TimeRange::days_of_week);

    py::class_<RuleConditions>(m, "RuleConditions")
        .def(py::init<>())
        .def_readwrite("procedure_types",     &RuleConditions::procedure_types)
        .def_readwrite("urgency_levels",      &RuleConditions::urgency_levels)
        .def_readwrite("channels",            &RuleConditions::channels)
        .def_readwrite("is_vip",              &RuleConditions::is_vip)
        .def_readwrite("is_existing_patient", &RuleConditions::is_existing_patient)
        .def_readwrite("lead_scores",         &RuleConditions::lead_scores)
        .def_readwrite("time_range",          &RuleConditions::time_range);

    py::class_<RoutingDirective>(m, "RoutingDirective")
        .def(py::init<>())
        .def_readwrite("strategy",               &RoutingDirective::strategy)
        .def_readwrite("skill_requirements",     &RoutingDirective::skill_requirements)
        .def_readwrite("fallback_behavior",      &RoutingDirective::fallback_behavior)
        .def_readwrite("max_queue_time_seconds", &RoutingDirective::max_queue_time_seconds);

    py::class_<RoutingRule>(m, "RoutingRule")
        .def(py::init<>())
        .def_readwrite("id",         &RoutingRule::id)
        .def_readwrite("name",       &RoutingRule::name)
        .def_readwrite("priority",   &RoutingRule::priority)
        .def_readwrite("active",     &RoutingRule::active)
        .def_readwrite("conditions", &RoutingRule::conditions)
        .def_readwrite("routing",    &RoutingRule::routing)
        .def_readonly("created_at",  &RoutingRule::created_at)
        .def_readonly("updated_at",  &RoutingRule::updated_at)
        .def("__repr__", [](const RoutingRule& r) {
            return "<RoutingRule id='" + r.id + "' priority=" + std::to_string(r.priority) + ">";
        });

    py::class_<RoutingContext>(m, "RoutingContext")
        .def(py::init<>())
        .def_readwrite("task_id",              &RoutingContext::task_id)
        .def_readwrite("channel",              &RoutingContext::channel)
        .def_readwrite("urgency_level",        &RoutingContext::urgency_level)
        .def_readwrite("procedure_type",       &RoutingContext::procedure_type)
        .def_readwrite("required_skills",      &RoutingContext::required_skills)
        .def_readwrite("preferred_skills",     &RoutingContext::preferred_skills)
        .def_readwrite("prefer_agent_ids",     &RoutingContext::prefer_agent_ids)
        .def_readwrite("exclude_agent_ids",    &RoutingContext::exclude_agent_ids)
        .def_readwrite("required_language",    &RoutingContext::required_language)
        .def_readwrite("preferred_languages",  &RoutingContext::preferred_languages)
        .def_readwrite("team_id",              &RoutingContext::team_id)
        .def_readwrite("priority",             &RoutingContext::priority)
        .def_readwrite("sla_deadline_minutes", &RoutingContext::sla_deadline_minutes)
        .def_readwrite("is_existing_patient",  &RoutingContext::is_existing_patient)
        .def_readwrite("is_vip",               &RoutingContext::is_vip)
        .def_readwrite("lead_score",           &RoutingContext::lead_score)
        .def_readwrite("requested_at",         &RoutingContext::requested_at);

    py::class_<AgentMatchScore>(m, "AgentMatchScore")
        .def(py::init<>())
        .def_readwrite("agent_id",            &AgentMatchScore::agent_id)
        .def_readwrite("agent_name",          &AgentMatchScore::agent_name)
        .def_readwrite("total_score",         &AgentMatchScore::total_score)
        .def_readwrite("skill_score",         &AgentMatchScore::skill_score)
        .def_readwrite("preference_score",    &AgentMatchScore::preference_score)
        .def_readwrite("load_penalty",        &AgentMatchScore::load_penalty)
        .def_readwrite("primary_proficiency", &AgentMatchScore::primary_proficiency)
        .def_readwrite("current_task_count",  &AgentMatchScore::current_task_count)
        .def_readwrite("factors",             &AgentMatchScore::factors);

    py::class_<RoutingDecision>(m, "RoutingDecision")
        .def(py::init<>())
        .def_readonly("id",                     &RoutingDecision::id)
        .def_readonly("task_id",                &RoutingDecision::task_id)
        .def_readonly("outcome",                &RoutingDecision::outcome)
        .def_readonly("selected_agent_id",      &RoutingDecision::selected_agent_id)
        .def_readonly("match_score",            &RoutingDecision::match_score)
        .def_readonly("reasoning",              &RoutingDecision::reasoning)
        .def_readonly("timestamp",              &RoutingDecision::timestamp)
        .def_readonly("applied_rule_id",        &RoutingDecision::applied_rule_id)
        .def_readonly("applied_rule_name",      &RoutingDecision::applied_rule_name)
        .def_readonly("strategy",               &RoutingDecision::strategy)
        .def_readonly("fallback_used",          &RoutingDecision::fallback_used)
        .def_readonly("fallbacks_attempted",    &RoutingDecision::fallbacks_attempted)
        .def_readonly("queue_id",               &RoutingDecision::queue_id)
        .def_readonly("queue_position",         &RoutingDecision::queue_position)
        .def_readonly("estimated_wait_seconds", &RoutingDecision::estimated_wait_seconds)
        .def_readonly("candidates",             &RoutingDecision::candidates)
        .def("__repr__", [](const RoutingDecision& d) {
            return "<RoutingDecision task='" + d.task_id + "' outcome="
                 + std::string(to_string(d.outcome)) + ">";
        });

    py::class_<QueuedTask>(m, "QueuedTask")
        .def(py::init<>())
        .def_readonly("task_id",     &QueuedTask::task_id)
        .def_readonly("enqueued_at", &QueuedTask::enqueued_at)
        .def_readonly("priority",    &QueuedTask::priority)
        .def_readonly("context",     &QueuedTask::context)
        .def_readonly("queue_id",    &QueuedTask::queue_id);

    py::class_<EnqueueResult>(m, "EnqueueResult")
        .def(py::init<>())
        .def_readonly("queue_id", &EnqueueResult::queue_id)
        .def_readonly("position", &EnqueueResult::position);

    py::class_<AgentMatchCheck>(m, "AgentMatchCheck")
        .def(py::init<>())
        .def_readonly("matches",        &AgentMatchCheck::matches)
        .def_readonly("missing_skills", &AgentMatchCheck::missing_skills);

    // ---- Configuration ----------------------------------------------------

    py::class_<ScoringWeights>(m, "ScoringWeights")
        .def(py::init<>())
        .def_readwrite("required_skill_base",      &ScoringWeights::required_skill_base)
        .def_readwrite("proficiency_step_bonus",   &ScoringWeights::proficiency_step_bonus)
        .def_readwrite("preferred_skill_bonus",    &ScoringWeights::preferred_skill_bonus)
        .def_readwrite("preferred_agent_bonus",    &ScoringWeights::preferred_agent_bonus)
        .def_readwrite("preferred_language_bonus", &ScoringWeights::preferred_language_bonus)
        .def_readwrite("load_penalty",             &ScoringWeights::load_penalty);

    py::class_<MatchThresholds>(m, "MatchThresholds")
        .def(py::init<>())
        .def_readwrite("minimum_match_score",       &MatchThresholds::minimum_match_score)
        .def_readwrite("max_concurrent_task_ratio", &MatchThresholds::max_concurrent_task_ratio);

    py::class_<QueueConfig>(m, "QueueConfig")
        .def(py::init<>())
        .def_readwrite("default_queue_id",         &QueueConfig::default_queue_id)
        .def_readwrite("average_handling_seconds", &QueueConfig::average_handling_seconds)
        .def_readwrite("max_queue_size",           &QueueConfig::max_queue_size);

    py::class_<FeatureFlags>(m, "FeatureFlags")
        .def(py::init<>())
        .def_readwrite("enable_skill_inheritance",    &FeatureFlags::enable_skill_inheritance)
        .def_readwrite("allow_proficiency_downgrade", &FeatureFlags::allow_proficiency_downgrade)
        .def_readwrite("enable_cross_team_reassign",  &FeatureFlags::enable_cross_team_reassign);

    py::class_<RoutingConfig>(m, "RoutingConfig")
        .def(py::init<>())
        .def_readwrite("default_strategy", &RoutingConfig::default_strategy)
        .def_readwrite("default_fallback", &RoutingConfig::default_fallback)
        .def_readwrite("weights",          &RoutingConfig::weights)
        .def_readwrite("thresholds",       &RoutingConfig::thresholds)
        .def_readwrite("queue",            &RoutingConfig::queue)
        .def_readwrite("features",         &RoutingConfig::features);

    // ---- Priority constants -----------------------------------------------

    m.attr("PRIORITY_LOW")      = PRIORITY_LOW;
    m.attr("PRIORITY_NORMAL")   = PRIORITY_NORMAL;
    m.attr("PRIORITY_HIGH")     = PRIORITY_HIGH;
    m.attr("PRIORITY_CRITICAL") = PRIORITY_CRITICAL;
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_SkillRouteError =
        py::register_exception<SkillRouteException>(m, "SkillRouteError", PyExc_RuntimeError);

    // Derived from SkillRouteError
    static auto py_InvalidAgentProfileError =
        py::register_exception<InvalidAgentProfileException>(m, "InvalidAgentProfileError", py_SkillRouteError.ptr());
    static auto py_InvalidRoutingRuleError =
        py::register_exception<InvalidRoutingRuleException>(m, "InvalidRoutingRuleError", py_SkillRouteError.ptr());
    static auto py_QueueFullError =
        py::register_exception<QueueFullException>(m, "QueueFullError", py_SkillRouteError.ptr());
    static auto py_MissingCollaboratorError =
        py::register_exception<MissingCollaboratorException>(m, "MissingCollaboratorError", py_SkillRouteError.ptr());
}
