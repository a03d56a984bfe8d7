#include <gtest/gtest.h>
#include <skillroute/skillroute.hpp>

using namespace skillroute;
using namespace std::chrono_literals;

// ===========================================================================
// Defaults
// ===========================================================================

TEST(AgentTest, ConstructionWithDefaults) {
    AgentProfile a;
    a.id = "agent-1";
    a.name = "Dana";
    EXPECT_EQ(a.role, "agent");
    EXPECT_EQ(a.availability, Availability::Offline);
    EXPECT_EQ(a.current_task_count, 0);
    EXPECT_EQ(a.max_concurrent_tasks, 1);
    EXPECT_FALSE(a.team_id.has_value());
    EXPECT_FALSE(a.is_available());
}

TEST(AgentTest, ProficiencyOrdering) {
    EXPECT_LT(ProficiencyLevel::Basic, ProficiencyLevel::Intermediate);
    EXPECT_LT(ProficiencyLevel::Intermediate, ProficiencyLevel::Advanced);
    EXPECT_LT(ProficiencyLevel::Advanced, ProficiencyLevel::Expert);
    EXPECT_EQ(weight(ProficiencyLevel::Expert) - weight(ProficiencyLevel::Basic), 3);
}

// ===========================================================================
// Skill lookup
// ===========================================================================

TEST(AgentTest, FindSkillIgnoresInactiveEntries) {
    AgentProfile a;
    a.skills = {
        {"procedure:implants", ProficiencyLevel::Expert, false},
        {"procedure:implants", ProficiencyLevel::Basic, true},
    };

    const auto* s = a.find_skill("procedure:implants");
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->proficiency, ProficiencyLevel::Basic);
    EXPECT_EQ(a.find_skill("procedure:cosmetic"), nullptr);
}

TEST(AgentTest, FindSkillReturnsStrongestActiveEntry) {
    AgentProfile a;
    a.skills = {
        {"language:spanish", ProficiencyLevel::Intermediate, true},
        {"language:spanish", ProficiencyLevel::Advanced, true},
    };

    const auto* s = a.find_skill("language:spanish");
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->proficiency, ProficiencyLevel::Advanced);
}

TEST(AgentTest, HasSkillRespectsMinimum) {
    AgentProfile a;
    a.skills = {{"procedure:orthodontics", ProficiencyLevel::Advanced, true}};

    EXPECT_TRUE(a.has_skill("procedure:orthodontics"));
    EXPECT_TRUE(a.has_skill("procedure:orthodontics", ProficiencyLevel::Advanced));
    EXPECT_FALSE(a.has_skill("procedure:orthodontics", ProficiencyLevel::Expert));
    EXPECT_FALSE(a.has_skill("procedure:implants"));
}

TEST(AgentTest, Speaks) {
    AgentProfile a;
    a.languages = {"en", "es"};
    EXPECT_TRUE(a.speaks("es"));
    EXPECT_FALSE(a.speaks("pt"));
}

// ===========================================================================
// Capacity
// ===========================================================================

TEST(AgentTest, LoadRatio) {
    AgentProfile a;
    a.max_concurrent_tasks = 4;
    a.current_task_count = 1;
    EXPECT_DOUBLE_EQ(a.load_ratio(), 0.25);
}

TEST(AgentTest, HasCapacityRequiresAvailability) {
    AgentProfile a;
    a.max_concurrent_tasks = 3;
    a.availability = Availability::Busy;
    EXPECT_FALSE(a.has_capacity());

    a.availability = Availability::Available;
    EXPECT_TRUE(a.has_capacity());
}

TEST(AgentTest, HasCapacityStopsAtMax) {
    AgentProfile a;
    a.availability = Availability::Available;
    a.max_concurrent_tasks = 2;
    a.current_task_count = 2;
    EXPECT_FALSE(a.has_capacity());
}

TEST(AgentTest, HasCapacityHonorsRatio) {
    AgentProfile a;
    a.availability = Availability::Available;
    a.max_concurrent_tasks = 5;
    a.current_task_count = 4;

    EXPECT_TRUE(a.has_capacity(1.0));
    EXPECT_FALSE(a.has_capacity(0.8));  // 4 < 4.0 fails
}
