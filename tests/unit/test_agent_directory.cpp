#include <gtest/gtest.h>
#include <skillroute/skillroute.hpp>

#include <algorithm>
#include <thread>

using namespace skillroute;
using namespace std::chrono_literals;

// ===========================================================================
// Helper: create a worker with the given skills
// ===========================================================================

static AgentProfile make_agent(const AgentId& id,
                               std::vector<AgentSkill> skills = {},
                               Availability availability = Availability::Available,
                               std::optional<TeamId> team = std::nullopt) {
    AgentProfile a;
    a.id = id;
    a.name = "Agent " + id;
    a.availability = availability;
    a.skills = std::move(skills);
    a.team_id = std::move(team);
    a.max_concurrent_tasks = 2;
    return a;
}

// ===========================================================================
// Registration
// ===========================================================================

TEST(AgentDirectoryTest, UpsertAndQuery) {
    AgentDirectory dir;
    dir.upsert(make_agent("a1"));

    auto a = dir.by_id("a1");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->name, "Agent a1");
    EXPECT_TRUE(a->created_at != Timestamp{});
    EXPECT_TRUE(a->updated_at != Timestamp{});
    EXPECT_EQ(dir.size(), 1u);
}

TEST(AgentDirectoryTest, UpsertReplacesWholeProfile) {
    AgentDirectory dir;
    auto a = make_agent("a1", {{"procedure:implants", ProficiencyLevel::Expert, true}});
    a.languages = {"en"};
    dir.upsert(a);

    auto replacement = make_agent("a1");
    replacement.name = "Renamed";
    dir.upsert(replacement);

    auto stored = dir.by_id("a1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->name, "Renamed");
    EXPECT_TRUE(stored->skills.empty());
    EXPECT_TRUE(stored->languages.empty());
    EXPECT_EQ(dir.size(), 1u);
}

TEST(AgentDirectoryTest, UpsertRejectsInvalidProfiles) {
    AgentDirectory dir;
    EXPECT_THROW(dir.upsert(make_agent("")), InvalidAgentProfileException);

    auto zero_cap = make_agent("a1");
    zero_cap.max_concurrent_tasks = 0;
    EXPECT_THROW(dir.upsert(zero_cap), InvalidAgentProfileException);

    auto negative = make_agent("a2");
    negative.current_task_count = -1;
    EXPECT_THROW(dir.upsert(negative), InvalidAgentProfileException);

    EXPECT_EQ(dir.size(), 0u);
}

TEST(AgentDirectoryTest, RemoveIsIdempotent) {
    AgentDirectory dir;
    dir.upsert(make_agent("a1"));
    EXPECT_TRUE(dir.remove("a1"));
    EXPECT_FALSE(dir.remove("a1"));
    EXPECT_FALSE(dir.by_id("a1").has_value());
}

TEST(AgentDirectoryTest, ByIdUnknownReturnsNullopt) {
    AgentDirectory dir;
    EXPECT_FALSE(dir.by_id("nobody").has_value());
}

TEST(AgentDirectoryTest, AllKeepsInsertionOrder) {
    AgentDirectory dir;
    dir.upsert(make_agent("c"));
    dir.upsert(make_agent("a"));
    dir.upsert(make_agent("b"));

    auto all = dir.all();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "c");
    EXPECT_EQ(all[1].id, "a");
    EXPECT_EQ(all[2].id, "b");

    dir.clear();
    EXPECT_TRUE(dir.all().empty());
}

// ===========================================================================
// Availability filtering
// ===========================================================================

TEST(AgentDirectoryTest, AvailableExcludesBusyAndOffline) {
    AgentDirectory dir;
    dir.upsert(make_agent("a1", {}, Availability::Available));
    dir.upsert(make_agent("a2", {}, Availability::Busy));
    dir.upsert(make_agent("a3", {}, Availability::Offline));

    auto avail = dir.available();
    ASSERT_EQ(avail.size(), 1u);
    EXPECT_EQ(avail[0].id, "a1");
}

TEST(AgentDirectoryTest, AvailableFiltersByTeam) {
    AgentDirectory dir;
    dir.upsert(make_agent("a1", {}, Availability::Available, TeamId("ortho")));
    dir.upsert(make_agent("a2", {}, Availability::Available, TeamId("implants")));
    dir.upsert(make_agent("a3", {}, Availability::Available));

    auto ortho = dir.available(TeamId("ortho"));
    ASSERT_EQ(ortho.size(), 1u);
    EXPECT_EQ(ortho[0].id, "a1");

    EXPECT_EQ(dir.available().size(), 3u);
    EXPECT_TRUE(dir.available(TeamId("billing")).empty());
}

// ===========================================================================
// Skill queries
// ===========================================================================

TEST(AgentDirectoryTest, BySkillIsMonotonicInProficiency) {
    AgentDirectory dir;
    dir.upsert(make_agent("basic", {{"s", ProficiencyLevel::Basic, true}}));
    dir.upsert(make_agent("inter", {{"s", ProficiencyLevel::Intermediate, true}}));
    dir.upsert(make_agent("adv", {{"s", ProficiencyLevel::Advanced, true}}));
    dir.upsert(make_agent("expert", {{"s", ProficiencyLevel::Expert, true}}));
    dir.upsert(make_agent("inactive", {{"s", ProficiencyLevel::Expert, false}}));

    auto ids = [&](ProficiencyLevel min) {
        std::vector<AgentId> out;
        for (auto& a : dir.by_skill("s", min)) out.push_back(a.id);
        return out;
    };

    auto b = ids(ProficiencyLevel::Basic);
    auto i = ids(ProficiencyLevel::Intermediate);
    auto a = ids(ProficiencyLevel::Advanced);
    auto e = ids(ProficiencyLevel::Expert);

    EXPECT_EQ(b.size(), 4u);
    EXPECT_EQ(i.size(), 3u);
    EXPECT_EQ(a.size(), 2u);
    ASSERT_EQ(e.size(), 1u);
    EXPECT_EQ(e[0], "expert");

    auto subset = [](const std::vector<AgentId>& small, const std::vector<AgentId>& big) {
        for (auto& id : small) {
            if (std::find(big.begin(), big.end(), id) == big.end()) return false;
        }
        return true;
    };
    EXPECT_TRUE(subset(e, a));
    EXPECT_TRUE(subset(a, i));
    EXPECT_TRUE(subset(i, b));

    for (auto* set : {&b, &i, &a, &e}) {
        EXPECT_TRUE(std::find(set->begin(), set->end(), "inactive") == set->end());
    }
}

TEST(AgentDirectoryTest, BySkillWithoutMinimumMatchesAnyActiveEntry) {
    AgentDirectory dir;
    dir.upsert(make_agent("a1", {{"s", ProficiencyLevel::Basic, true}}));
    dir.upsert(make_agent("a2", {{"other", ProficiencyLevel::Expert, true}}));

    auto found = dir.by_skill("s");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, "a1");
}

// ===========================================================================
// Updates
// ===========================================================================

TEST(AgentDirectoryTest, SetAvailabilityRefreshesUpdatedAt) {
    AgentDirectory dir;
    dir.upsert(make_agent("a1", {}, Availability::Offline));
    auto before = dir.by_id("a1")->updated_at;

    std::this_thread::sleep_for(2ms);
    dir.set_availability("a1", Availability::Available);

    auto after = dir.by_id("a1");
    EXPECT_EQ(after->availability, Availability::Available);
    EXPECT_TRUE(after->updated_at > before);
}

TEST(AgentDirectoryTest, SetTaskCountRefreshesUpdatedAt) {
    AgentDirectory dir;
    dir.upsert(make_agent("a1"));
    auto before = dir.by_id("a1")->updated_at;

    std::this_thread::sleep_for(2ms);
    dir.set_task_count("a1", 2);

    auto after = dir.by_id("a1");
    EXPECT_EQ(after->current_task_count, 2);
    EXPECT_TRUE(after->updated_at > before);
}

TEST(AgentDirectoryTest, UpdatesOnUnknownIdAreNoOps) {
    AgentDirectory dir;
    EXPECT_NO_THROW(dir.set_availability("ghost", Availability::Available));
    EXPECT_NO_THROW(dir.set_task_count("ghost", 3));
    EXPECT_NO_THROW(dir.release_task_slot("ghost"));
    EXPECT_EQ(dir.size(), 0u);
}

// ===========================================================================
// Task slots
// ===========================================================================

TEST(AgentDirectoryTest, TryAcquireStopsAtMax) {
    AgentDirectory dir;
    dir.upsert(make_agent("a1"));  // max 2

    EXPECT_TRUE(dir.try_acquire_task_slot("a1"));
    EXPECT_TRUE(dir.try_acquire_task_slot("a1"));
    EXPECT_FALSE(dir.try_acquire_task_slot("a1"));
    EXPECT_EQ(dir.by_id("a1")->current_task_count, 2);

    dir.release_task_slot("a1");
    EXPECT_EQ(dir.by_id("a1")->current_task_count, 1);
    EXPECT_TRUE(dir.try_acquire_task_slot("a1"));
}

TEST(AgentDirectoryTest, TryAcquireRejectsUnavailable) {
    AgentDirectory dir;
    dir.upsert(make_agent("a1", {}, Availability::Busy));
    EXPECT_FALSE(dir.try_acquire_task_slot("a1"));
    EXPECT_FALSE(dir.try_acquire_task_slot("ghost"));
}

TEST(AgentDirectoryTest, ReleaseNeverGoesNegative) {
    AgentDirectory dir;
    dir.upsert(make_agent("a1"));
    dir.release_task_slot("a1");
    EXPECT_EQ(dir.by_id("a1")->current_task_count, 0);
}
