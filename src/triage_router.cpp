#include "skillroute/triage_router.hpp"
#include "skillroute/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace skillroute {

namespace {

std::string normalize(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();

    std::string out;
    if (first >= last) return out;
    out.reserve(static_cast<std::size_t>(last - first));
    for (auto it = first; it != last; ++it) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*it))));
    }
    return out;
}

void add_requirement(std::vector<SkillRequirement>& list, const SkillId& skill_id,
                     ProficiencyLevel minimum, RequirementKind kind) {
    auto it = std::find_if(list.begin(), list.end(),
        [&](const SkillRequirement& r) { return r.skill_id == skill_id; });
    if (it == list.end()) {
        list.push_back(SkillRequirement{skill_id, minimum, kind});
    } else if (minimum > it->minimum_proficiency) {
        it->minimum_proficiency = minimum;
    }
}

} // anonymous namespace

TriageRouter::TriageRouter(std::shared_ptr<TriageAssessor> assessor,
                           std::shared_ptr<DispatchEngine> engine,
                           TriageRoutingConfig config)
    : assessor_(std::move(assessor))
    , engine_(std::move(engine))
    , config_(std::move(config))
{
    if (!assessor_) throw MissingCollaboratorException("triage assessor");
    if (!engine_) throw MissingCollaboratorException("dispatch engine");

    // Lookups are done on normalized keys
    std::map<std::string, std::vector<SkillId>> normalized;
    for (auto& [procedure, skills] : config_.procedure_skills) {
        normalized[normalize(procedure)] = skills;
    }
    config_.procedure_skills = std::move(normalized);
}

TriageRoutingResult TriageRouter::route(const TriageInput& input) {
    auto result = assess(input);
    result.decision = engine_->route(result.context);
    return result;
}

TriageRoutingResult TriageRouter::triage_only(const TriageInput& input) {
    return assess(input);
}

void TriageRouter::update_procedure_mapping(const std::string& procedure,
                                            std::vector<SkillId> skills) {
    std::unique_lock lock(config_mutex_);
    config_.procedure_skills[normalize(procedure)] = std::move(skills);
}

TriageRoutingConfig TriageRouter::config() const {
    std::shared_lock lock(config_mutex_);
    return config_;
}

// ==================== Mapping ====================

Channel TriageRouter::map_channel(LeadChannel channel) {
    switch (channel) {
        case LeadChannel::Whatsapp: return Channel::Whatsapp;
        case LeadChannel::Voice:    return Channel::Voice;
        default:                    return Channel::Web;
    }
}

UrgencyLevel TriageRouter::map_urgency(TriageUrgency urgency) {
    switch (urgency) {
        case TriageUrgency::HighPriority: return UrgencyLevel::Critical;
        case TriageUrgency::High:         return UrgencyLevel::High;
        case TriageUrgency::Normal:       return UrgencyLevel::Normal;
        case TriageUrgency::Low:          return UrgencyLevel::Low;
    }
    return UrgencyLevel::Normal;
}

std::int64_t TriageRouter::sla_minutes(const std::string& recommendation) const {
    std::shared_lock lock(config_mutex_);
    auto it = config_.sla_minutes.find(recommendation);
    if (it == config_.sla_minutes.end()) return config_.default_sla_minutes;
    return it->second;
}

RoutingContext TriageRouter::build_context(const TriageInput& input,
                                           const TriageResult& result,
                                           bool vip) const {
    RoutingContext context;
    context.task_id = input.lead_id;
    context.channel = map_channel(input.channel);
    context.urgency_level = map_urgency(result.urgency_level);
    context.is_existing_patient = input.has_existing_relationship;
    context.is_vip = vip;
    context.lead_score = input.lead_score;
    context.sla_deadline_minutes = sla_minutes(result.routing_recommendation);

    std::shared_lock lock(config_mutex_);

    auto base = config_.urgency_priority.find(*context.urgency_level);
    context.priority = base != config_.urgency_priority.end() ? base->second : PRIORITY_NORMAL;
    auto boost = config_.lead_score_boost.find(input.lead_score);
    if (boost != config_.lead_score_boost.end()) context.priority += boost->second;

    // Procedure skills come first so the primary one leads the required list
    for (const auto& interest : input.procedure_interest) {
        auto key = normalize(interest);
        if (key.empty()) continue;
        if (!context.procedure_type) context.procedure_type = key;

        auto it = config_.procedure_skills.find(key);
        if (it == config_.procedure_skills.end()) continue;
        for (const auto& skill : it->second) {
            add_requirement(context.required_skills, skill,
                            config_.default_procedure_proficiency, RequirementKind::Required);
        }
    }
    bool has_procedure_skill = !context.required_skills.empty();

    if (vip) {
        if (config_.vip_skill_required) {
            add_requirement(context.required_skills, config_.vip_skill_id,
                            ProficiencyLevel::Basic, RequirementKind::Required);
        } else {
            add_requirement(context.preferred_skills, config_.vip_skill_id,
                            ProficiencyLevel::Basic, RequirementKind::Preferred);
        }
    }

    if (context.urgency_level == UrgencyLevel::High ||
        context.urgency_level == UrgencyLevel::Critical) {
        add_requirement(context.preferred_skills, config_.escalation_skill_id,
                        ProficiencyLevel::Basic, RequirementKind::Preferred);
        if (has_procedure_skill &&
            context.required_skills.front().minimum_proficiency < ProficiencyLevel::Advanced) {
            context.required_skills.front().minimum_proficiency = ProficiencyLevel::Advanced;
        }
    }

    if (config_.use_suggested_owner_as_preference && result.suggested_owner &&
        !result.suggested_owner->empty()) {
        context.prefer_agent_ids.push_back(*result.suggested_owner);
    }

    return context;
}

TriageRoutingResult TriageRouter::assess(const TriageInput& input) {
    TriageRoutingResult out;
    out.triage_result = assessor_->assess(input);

    const auto& subject = input.contact_phone.empty() ? input.message_content
                                                      : input.contact_phone;
    bool vip = assessor_->is_vip(subject);

    out.context = build_context(input, out.triage_result, vip);
    return out;
}

} // namespace skillroute
