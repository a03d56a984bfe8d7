// 02_triage_routing.cpp
//
// Triage-driven routing: inbound leads are assessed by a triage component,
// mapped to skills/priority/SLA, then dispatched.
//
// Scenario:
//   - A rules-based assessor flags pain keywords as high priority and a
//     known phone number as VIP.
//   - Leads arrive over WhatsApp, web forms and phone calls.
//   - The router derives required skills from procedure interest and
//     hands the request to the dispatch engine.

#include <skillroute/skillroute.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

using namespace skillroute;

// Stand-in for the CRM's triage service
class FrontDeskAssessor : public TriageAssessor {
public:
    TriageResult assess(const TriageInput& input) override {
        std::string text = input.message_content;
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        TriageResult r;
        if (text.find("pain") != std::string::npos || text.find("swelling") != std::string::npos) {
            r.urgency_level = TriageUrgency::HighPriority;
            r.routing_recommendation = "next_available_slot";
            r.medical_flags = {"pain_reported"};
            r.notes = "Clinical symptoms mentioned";
        } else if (input.lead_score == LeadScore::Hot) {
            r.urgency_level = TriageUrgency::High;
            r.routing_recommendation = "same_day";
        } else if (input.lead_score == LeadScore::Warm) {
            r.urgency_level = TriageUrgency::Normal;
            r.routing_recommendation = "next_business_day";
        } else {
            r.urgency_level = TriageUrgency::Low;
            r.routing_recommendation = "nurture_sequence";
        }
        if (input.has_existing_relationship) r.suggested_owner = "dana";
        return r;
    }

    bool is_vip(const std::string& text) const override {
        return text == "+15550199";
    }
};

static void print_result(const TriageRoutingResult& r) {
    std::cout << "  urgency=" << to_string(r.triage_result.urgency_level)
              << " priority=" << r.context.priority
              << " sla=" << r.context.sla_deadline_minutes.value_or(0) << "min"
              << " vip=" << (r.context.is_vip ? "yes" : "no") << "\n";
    std::cout << "  required:";
    for (const auto& s : r.context.required_skills) {
        std::cout << " " << s.skill_id << "(" << to_string(s.minimum_proficiency) << ")";
    }
    std::cout << "\n  preferred:";
    for (const auto& s : r.context.preferred_skills) std::cout << " " << s.skill_id;
    std::cout << "\n";
    if (r.decision) {
        std::cout << "  -> " << to_string(r.decision->outcome);
        if (r.decision->selected_agent_id) std::cout << " " << *r.decision->selected_agent_id;
        std::cout << "\n";
    }
    std::cout << "\n";
}

int main() {
    std::cout << "=== SkillRoute: Triage Routing Example ===\n\n";

    auto agents = std::make_shared<AgentDirectory>();
    auto rules = std::make_shared<RuleStore>();
    auto queue = std::make_shared<TaskQueueManager>();
    auto engine = std::make_shared<DispatchEngine>(agents, rules, queue);

    auto metrics = std::make_shared<MetricsMonitor>();
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(std::make_shared<ConsoleMonitor>());
    composite->add_monitor(metrics);
    engine->set_monitor(composite);

    // ----------------------------------------------------------------
    // Staff
    // ----------------------------------------------------------------
    auto add = [&](const std::string& id, std::vector<AgentSkill> skills, int max_tasks) {
        AgentProfile a;
        a.id = id;
        a.name = id;
        a.availability = Availability::Available;
        a.max_concurrent_tasks = max_tasks;
        a.skills = std::move(skills);
        agents->upsert(std::move(a));
    };
    add("dana", {{"procedure:implants", ProficiencyLevel::Expert, true},
                 {"procedure:all-on-x", ProficiencyLevel::Advanced, true},
                 {"customer_service:escalations", ProficiencyLevel::Advanced, true}}, 2);
    add("lee", {{"procedure:cosmetic", ProficiencyLevel::Expert, true},
                {"customer_service:vip", ProficiencyLevel::Advanced, true}}, 2);
    add("sam", {{"procedure:general-dentistry", ProficiencyLevel::Advanced, true},
                {"procedure:orthodontics", ProficiencyLevel::Intermediate, true}}, 3);

    // Urgent leads are never left waiting
    RoutingRule urgent;
    urgent.id = "urgent";
    urgent.name = "Critical leads";
    urgent.priority = 100;
    urgent.conditions.urgency_levels = std::vector<UrgencyLevel>{UrgencyLevel::Critical};
    urgent.routing.fallback_behavior = FallbackBehavior::Reassign;
    rules->upsert(urgent);

    TriageRouter router(std::make_shared<FrontDeskAssessor>(), engine);

    // Clinic-specific procedure naming
    router.update_procedure_mapping("Invisalign", {"procedure:orthodontics"});

    // ----------------------------------------------------------------
    // Leads
    // ----------------------------------------------------------------
    TriageInput a;
    a.lead_id = "lead-100";
    a.lead_score = LeadScore::Warm;
    a.channel = LeadChannel::Whatsapp;
    a.message_content = "Swelling around my all-on-4, what should I do?";
    a.procedure_interest = {"All-on-X"};
    a.has_existing_relationship = true;
    std::cout << "Lead 100 (WhatsApp, existing patient):\n";
    print_result(router.route(a));

    TriageInput b;
    b.lead_id = "lead-101";
    b.lead_score = LeadScore::Hot;
    b.channel = LeadChannel::Facebook;
    b.message_content = "Looking for veneers before my wedding";
    b.procedure_interest = {"Veneers"};
    b.contact_phone = "+15550199";
    std::cout << "Lead 101 (Facebook, VIP):\n";
    print_result(router.route(b));

    TriageInput c;
    c.lead_id = "lead-102";
    c.lead_score = LeadScore::Cold;
    c.channel = LeadChannel::WebForm;
    c.message_content = "Just curious about pricing";
    c.procedure_interest = {"Invisalign", "Laser gum contouring"};
    std::cout << "Lead 102 (web form) preview only:\n";
    print_result(router.triage_only(c));

    auto m = metrics->get_metrics();
    std::cout << "Routed " << m.total_routed << ": " << m.assigned << " assigned, "
              << m.queued << " queued, " << m.escalated << " escalated, "
              << m.reassign_attempts << " reassign attempts\n";

    std::cout << "\n=== Example complete ===\n";
    return 0;
}
