#include <gtest/gtest.h>
#include <skillroute/skillroute.hpp>

#include <algorithm>
#include <stdexcept>

using namespace skillroute;

// ===========================================================================
// Fake triage collaborator with a scripted result
// ===========================================================================

class ScriptedAssessor : public TriageAssessor {
public:
    TriageResult next;
    std::vector<std::string> vip_numbers;
    mutable std::vector<std::string> vip_queries;
    bool fail{false};

    TriageResult assess(const TriageInput&) override {
        if (fail) throw std::runtime_error("triage service unavailable");
        return next;
    }

    bool is_vip(const std::string& text) const override {
        vip_queries.push_back(text);
        return std::find(vip_numbers.begin(), vip_numbers.end(), text) != vip_numbers.end();
    }
};

class TriageRouterTest : public ::testing::Test {
protected:
    std::shared_ptr<AgentDirectory> agents = std::make_shared<AgentDirectory>();
    std::shared_ptr<RuleStore> rules = std::make_shared<RuleStore>();
    std::shared_ptr<TaskQueueManager> queue = std::make_shared<TaskQueueManager>();
    std::shared_ptr<DispatchEngine> engine =
        std::make_shared<DispatchEngine>(agents, rules, queue);
    std::shared_ptr<ScriptedAssessor> assessor = std::make_shared<ScriptedAssessor>();
    std::unique_ptr<TriageRouter> router;

    void SetUp() override {
        assessor->next.urgency_level = TriageUrgency::Normal;
        assessor->next.routing_recommendation = "same_day";
        router = std::make_unique<TriageRouter>(assessor, engine);
    }

    static TriageInput lead(std::vector<std::string> procedures = {},
                            LeadScore score = LeadScore::Cold,
                            LeadChannel channel = LeadChannel::Web) {
        TriageInput in;
        in.lead_id = "lead-1";
        in.lead_score = score;
        in.channel = channel;
        in.message_content = "Hi, I'd like information";
        in.procedure_interest = std::move(procedures);
        return in;
    }
};

static const SkillRequirement* find_req(const std::vector<SkillRequirement>& list,
                                        const SkillId& id) {
    auto it = std::find_if(list.begin(), list.end(),
        [&id](const SkillRequirement& r) { return r.skill_id == id; });
    return it == list.end() ? nullptr : &*it;
}

// ===========================================================================
// Construction
// ===========================================================================

TEST_F(TriageRouterTest, ConstructorRejectsMissingCollaborators) {
    EXPECT_THROW(std::make_unique<TriageRouter>(nullptr, engine),
                 MissingCollaboratorException);
    EXPECT_THROW(std::make_unique<TriageRouter>(assessor, nullptr),
                 MissingCollaboratorException);
}

// ===========================================================================
// Channel and urgency mapping
// ===========================================================================

TEST_F(TriageRouterTest, ChannelMapping) {
    EXPECT_EQ(TriageRouter::map_channel(LeadChannel::Whatsapp), Channel::Whatsapp);
    EXPECT_EQ(TriageRouter::map_channel(LeadChannel::Voice), Channel::Voice);
    for (auto c : {LeadChannel::Web, LeadChannel::WebForm, LeadChannel::Hubspot,
                   LeadChannel::Facebook, LeadChannel::Google, LeadChannel::Referral,
                   LeadChannel::Manual}) {
        EXPECT_EQ(TriageRouter::map_channel(c), Channel::Web) << to_string(c);
    }
}

TEST_F(TriageRouterTest, UrgencyMapping) {
    EXPECT_EQ(TriageRouter::map_urgency(TriageUrgency::HighPriority), UrgencyLevel::Critical);
    EXPECT_EQ(TriageRouter::map_urgency(TriageUrgency::High), UrgencyLevel::High);
    EXPECT_EQ(TriageRouter::map_urgency(TriageUrgency::Normal), UrgencyLevel::Normal);
    EXPECT_EQ(TriageRouter::map_urgency(TriageUrgency::Low), UrgencyLevel::Low);
}

// ===========================================================================
// SLA
// ===========================================================================

TEST_F(TriageRouterTest, SlaMapping) {
    EXPECT_EQ(router->sla_minutes("next_available_slot"), 15);
    EXPECT_EQ(router->sla_minutes("same_day"), 60);
    EXPECT_EQ(router->sla_minutes("next_business_day"), 480);
    EXPECT_EQ(router->sla_minutes("nurture_sequence"), 1440);
    EXPECT_EQ(router->sla_minutes("call_back_someday"), 60);
    EXPECT_EQ(router->sla_minutes(""), 60);
}

TEST_F(TriageRouterTest, SlaFlowsIntoContext) {
    assessor->next.routing_recommendation = "next_business_day";
    auto result = router->triage_only(lead());
    EXPECT_EQ(result.context.sla_deadline_minutes.value_or(0), 480);
}

// ===========================================================================
// Priority
// ===========================================================================

TEST_F(TriageRouterTest, PriorityIsUrgencyPlusLeadBoost) {
    assessor->next.urgency_level = TriageUrgency::High;
    EXPECT_EQ(router->triage_only(lead({}, LeadScore::Hot)).context.priority, 90);
    EXPECT_EQ(router->triage_only(lead({}, LeadScore::Warm)).context.priority, 80);
    EXPECT_EQ(router->triage_only(lead({}, LeadScore::Cold)).context.priority, 75);

    assessor->next.urgency_level = TriageUrgency::Low;
    EXPECT_EQ(router->triage_only(lead({}, LeadScore::Unqualified)).context.priority, 25);
}

// ===========================================================================
// Procedure skills
// ===========================================================================

TEST_F(TriageRouterTest, ProcedureMappingIsCaseInsensitive) {
    auto result = router->triage_only(lead({"All-On-X"}));
    const auto& req = result.context.required_skills;

    ASSERT_EQ(req.size(), 2u);
    EXPECT_EQ(req[0].skill_id, "procedure:all-on-x");
    EXPECT_EQ(req[1].skill_id, "procedure:implants");
    EXPECT_EQ(req[0].minimum_proficiency, ProficiencyLevel::Intermediate);
    EXPECT_EQ(result.context.procedure_type.value_or(""), "all-on-x");
}

TEST_F(TriageRouterTest, UnmappedProcedureAddsNothing) {
    auto result = router->triage_only(lead({"Teeth Tattoos"}));
    EXPECT_TRUE(result.context.required_skills.empty());
    EXPECT_EQ(result.context.procedure_type.value_or(""), "teeth tattoos");
}

TEST_F(TriageRouterTest, OverlappingProceduresDoNotDuplicateSkills) {
    auto result = router->triage_only(lead({"implants", "all-on-x"}));
    const auto& req = result.context.required_skills;
    ASSERT_EQ(req.size(), 2u);
    EXPECT_EQ(req[0].skill_id, "procedure:implants");
    EXPECT_EQ(req[1].skill_id, "procedure:all-on-x");
}

TEST_F(TriageRouterTest, UpdateProcedureMapping) {
    router->update_procedure_mapping("Invisalign", {"procedure:orthodontics", "product:invisalign"});

    auto result = router->triage_only(lead({"invisalign"}));
    ASSERT_EQ(result.context.required_skills.size(), 2u);
    EXPECT_EQ(result.context.required_skills[1].skill_id, "product:invisalign");

    auto cfg = router->config();
    ASSERT_EQ(cfg.procedure_skills.count("invisalign"), 1u);
    EXPECT_EQ(cfg.procedure_skills.at("invisalign").size(), 2u);
}

TEST_F(TriageRouterTest, ConfigSnapshotIsACopy) {
    auto cfg = router->config();
    cfg.procedure_skills.clear();
    EXPECT_FALSE(router->config().procedure_skills.empty());
}

// ===========================================================================
// VIP and escalation handling
// ===========================================================================

TEST_F(TriageRouterTest, VipAddsPreferredVipSkill) {
    assessor->vip_numbers = {"+15550100"};
    auto in = lead({"veneers"});
    in.contact_phone = "+15550100";

    auto result = router->triage_only(in);

    EXPECT_TRUE(result.context.is_vip);
    const auto* vip = find_req(result.context.preferred_skills, "customer_service:vip");
    ASSERT_NE(vip, nullptr);
    EXPECT_EQ(vip->kind, RequirementKind::Preferred);
    EXPECT_EQ(find_req(result.context.required_skills, "customer_service:vip"), nullptr);
}

TEST_F(TriageRouterTest, VipSkillCanBeRequired) {
    TriageRoutingConfig cfg;
    cfg.vip_skill_required = true;
    TriageRouter strict(assessor, engine, cfg);
    assessor->vip_numbers = {"+15550100"};

    auto in = lead({"veneers"});
    in.contact_phone = "+15550100";
    auto result = strict.triage_only(in);

    ASSERT_EQ(result.context.required_skills.size(), 2u);
    EXPECT_EQ(result.context.required_skills[0].skill_id, "procedure:cosmetic");
    EXPECT_EQ(result.context.required_skills[1].skill_id, "customer_service:vip");
}

TEST_F(TriageRouterTest, VipCheckUsesPhoneThenMessage) {
    auto with_phone = lead();
    with_phone.contact_phone = "+15550123";
    router->triage_only(with_phone);

    auto without_phone = lead();
    router->triage_only(without_phone);

    ASSERT_EQ(assessor->vip_queries.size(), 2u);
    EXPECT_EQ(assessor->vip_queries[0], "+15550123");
    EXPECT_EQ(assessor->vip_queries[1], without_phone.message_content);
}

TEST_F(TriageRouterTest, HighUrgencyRaisesPrimaryProficiency) {
    assessor->next.urgency_level = TriageUrgency::HighPriority;
    auto result = router->triage_only(lead({"all-on-x"}));

    EXPECT_TRUE(result.context.urgency_level == UrgencyLevel::Critical);
    const auto& req = result.context.required_skills;
    ASSERT_EQ(req.size(), 2u);
    EXPECT_EQ(req[0].minimum_proficiency, ProficiencyLevel::Advanced);
    EXPECT_EQ(req[1].minimum_proficiency, ProficiencyLevel::Intermediate);
    EXPECT_NE(find_req(result.context.preferred_skills, "customer_service:escalations"), nullptr);
}

TEST_F(TriageRouterTest, NormalUrgencyAddsNoEscalationSkill) {
    auto result = router->triage_only(lead({"implants"}));
    EXPECT_EQ(find_req(result.context.preferred_skills, "customer_service:escalations"), nullptr);
    EXPECT_EQ(result.context.required_skills[0].minimum_proficiency,
              ProficiencyLevel::Intermediate);
}

TEST_F(TriageRouterTest, HighUrgencyWithoutProcedureStillPrefersEscalations) {
    assessor->next.urgency_level = TriageUrgency::High;
    auto result = router->triage_only(lead());
    EXPECT_TRUE(result.context.required_skills.empty());
    EXPECT_NE(find_req(result.context.preferred_skills, "customer_service:escalations"), nullptr);
}

// ===========================================================================
// Suggested owner
// ===========================================================================

TEST_F(TriageRouterTest, SuggestedOwnerBecomesPreferredAgent) {
    assessor->next.suggested_owner = "agent-7";
    auto result = router->triage_only(lead());
    EXPECT_EQ(result.context.prefer_agent_ids, (std::vector<AgentId>{"agent-7"}));
}

TEST_F(TriageRouterTest, SuggestedOwnerIgnoredWhenDisabled) {
    TriageRoutingConfig cfg;
    cfg.use_suggested_owner_as_preference = false;
    TriageRouter plain(assessor, engine, cfg);
    assessor->next.suggested_owner = "agent-7";

    EXPECT_TRUE(plain.triage_only(lead()).context.prefer_agent_ids.empty());
}

// ===========================================================================
// End-to-end
// ===========================================================================

TEST_F(TriageRouterTest, TriageOnlyDoesNotDispatch) {
    AgentProfile a;
    a.id = "a1";
    a.availability = Availability::Available;
    agents->upsert(a);

    auto result = router->triage_only(lead());
    EXPECT_FALSE(result.decision.has_value());
    EXPECT_EQ(agents->by_id("a1")->current_task_count, 0);
    EXPECT_EQ(queue->total_length(), 0u);
}

TEST_F(TriageRouterTest, RouteAssignsMatchingAgent) {
    AgentProfile a;
    a.id = "implant-specialist";
    a.name = "Sam";
    a.availability = Availability::Available;
    a.skills = {{"procedure:implants", ProficiencyLevel::Expert, true}};
    agents->upsert(a);

    auto in = lead({"implants"}, LeadScore::Hot, LeadChannel::Whatsapp);
    auto result = router->route(in);

    EXPECT_TRUE(result.context.channel == Channel::Whatsapp);
    EXPECT_EQ(result.context.task_id, "lead-1");
    ASSERT_TRUE(result.decision.has_value());
    EXPECT_EQ(result.decision->outcome, RoutingOutcome::Assigned);
    EXPECT_EQ(result.decision->selected_agent_id.value_or(""), "implant-specialist");
}

TEST_F(TriageRouterTest, RouteQueuesWhenNobodyQualifies) {
    auto result = router->route(lead({"orthodontics"}, LeadScore::Warm));

    ASSERT_TRUE(result.decision.has_value());
    EXPECT_EQ(result.decision->outcome, RoutingOutcome::Queued);
    EXPECT_EQ(queue->position("lead-1").value_or(0), 1u);
    EXPECT_EQ(queue->tasks("default")[0].priority, 55);
}

TEST_F(TriageRouterTest, LeadScoreFlowsIntoContext) {
    auto r = router->triage_only(lead({}, LeadScore::Warm));
    EXPECT_TRUE(r.context.lead_score == LeadScore::Warm);
}

TEST_F(TriageRouterTest, RuleWrittenWithDisplaySpellingMatchesLead) {
    RoutingRule rule;
    rule.id = "all-on-x-desk";
    rule.name = "All-on-X desk";
    rule.priority = 10;
    rule.conditions.procedure_types = std::vector<std::string>{"All-on-X"};
    rule.conditions.lead_scores = std::vector<LeadScore>{LeadScore::Hot};
    rule.routing.fallback_behavior = FallbackBehavior::Escalate;
    rules->upsert(rule);

    auto hot = router->route(lead({"All-on-X"}, LeadScore::Hot));
    ASSERT_TRUE(hot.decision.has_value());
    EXPECT_EQ(hot.decision->applied_rule_id.value_or(""), "all-on-x-desk");
    EXPECT_EQ(hot.decision->outcome, RoutingOutcome::Escalated);

    auto cold = lead({"all-on-x"}, LeadScore::Cold);
    cold.lead_id = "lead-2";
    auto result = router->route(cold);
    ASSERT_TRUE(result.decision.has_value());
    EXPECT_FALSE(result.decision->applied_rule_id.has_value());
}

TEST_F(TriageRouterTest, AssessorFailurePropagates) {
    assessor->fail = true;
    EXPECT_THROW(router->route(lead()), std::runtime_error);
    EXPECT_EQ(queue->total_length(), 0u);
}
