#include <gtest/gtest.h>
#include <skillroute/skillroute.hpp>

#include <atomic>
#include <random>
#include <thread>
#include <vector>

using namespace skillroute;
using namespace std::chrono_literals;

// ===========================================================================
// Helper: worker pool where every worker can handle every task
// ===========================================================================

static std::shared_ptr<AgentDirectory> make_pool(int workers, std::int32_t max_tasks) {
    auto dir = std::make_shared<AgentDirectory>();
    for (int i = 0; i < workers; ++i) {
        AgentProfile a;
        a.id = "agent-" + std::to_string(i);
        a.name = a.id;
        a.availability = Availability::Available;
        a.max_concurrent_tasks = max_tasks;
        a.skills = {{"customer_service:general", ProficiencyLevel::Intermediate, true}};
        dir->upsert(std::move(a));
    }
    return dir;
}

static RoutingContext general_task(const TaskId& id) {
    RoutingContext ctx;
    ctx.task_id = id;
    ctx.required_skills = {{"customer_service:general", ProficiencyLevel::Basic,
                            RequirementKind::Required}};
    return ctx;
}

// ===========================================================================
// Capacity is never exceeded under contention
// ===========================================================================

TEST(ConcurrentDispatchTest, StressTest_NoAgentExceedsCapacity) {
    constexpr int NUM_AGENTS = 5;
    constexpr int MAX_TASKS = 3;
    constexpr int NUM_THREADS = 8;
    constexpr int TASKS_PER_THREAD = 25;

    auto agents = make_pool(NUM_AGENTS, MAX_TASKS);
    auto rules = std::make_shared<RuleStore>();
    auto queue = std::make_shared<TaskQueueManager>();
    auto metrics = std::make_shared<MetricsMonitor>();
    DispatchEngine engine(agents, rules, queue);
    engine.set_monitor(metrics);

    std::atomic<int> assigned{0};
    std::atomic<int> queued{0};
    std::atomic<int> escalated{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < TASKS_PER_THREAD; ++i) {
                auto id = "t" + std::to_string(t) + "-" + std::to_string(i);
                auto d = engine.route(general_task(id));
                switch (d.outcome) {
                    case RoutingOutcome::Assigned:  assigned++;  break;
                    case RoutingOutcome::Queued:    queued++;    break;
                    case RoutingOutcome::Escalated: escalated++; break;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    // Exactly total capacity gets assigned; everything else waits
    EXPECT_EQ(assigned.load(), NUM_AGENTS * MAX_TASKS);
    EXPECT_EQ(queued.load(), NUM_THREADS * TASKS_PER_THREAD - NUM_AGENTS * MAX_TASKS);
    EXPECT_EQ(escalated.load(), 0);

    for (const auto& a : agents->all()) {
        EXPECT_LE(a.current_task_count, a.max_concurrent_tasks) << a.id;
    }
    EXPECT_EQ(queue->length("default"), static_cast<std::size_t>(queued.load()));

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.total_routed, static_cast<std::uint64_t>(NUM_THREADS * TASKS_PER_THREAD));
    EXPECT_EQ(m.assigned, static_cast<std::uint64_t>(assigned.load()));
}

TEST(ConcurrentDispatchTest, RouteAndReleaseInterleaved) {
    constexpr int NUM_AGENTS = 3;
    constexpr int NUM_THREADS = 6;
    constexpr int OPS_PER_THREAD = 50;

    auto agents = make_pool(NUM_AGENTS, 2);
    auto rules = std::make_shared<RuleStore>();
    auto queue = std::make_shared<TaskQueueManager>();

    RoutingRule rule;
    rule.id = "spread";
    rule.name = "Spread load";
    rule.routing.strategy = RoutingStrategy::LeastOccupied;
    rule.routing.fallback_behavior = FallbackBehavior::Escalate;
    rules->upsert(rule);

    DispatchEngine engine(agents, rules, queue);

    std::atomic<int> violations{0};
    std::atomic<int> assigned{0};
    std::atomic<int> released{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            std::mt19937 rng(static_cast<unsigned>(t * 31 + 5));
            std::uniform_int_distribution<int> hold(0, 2);
            for (int i = 0; i < OPS_PER_THREAD; ++i) {
                auto d = engine.route(general_task("t" + std::to_string(t) + "-" + std::to_string(i)));
                if (d.outcome != RoutingOutcome::Assigned) continue;
                assigned++;

                auto a = agents->by_id(*d.selected_agent_id);
                if (a && a->current_task_count > a->max_concurrent_tasks) violations++;

                std::this_thread::sleep_for(std::chrono::microseconds(100 * hold(rng)));
                engine.release(*d.selected_agent_id);
                released++;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_GT(assigned.load(), 0);
    EXPECT_EQ(assigned.load(), released.load());
    EXPECT_EQ(queue->total_length(), 0u);
    for (const auto& a : agents->all()) {
        EXPECT_EQ(a.current_task_count, 0) << a.id;
    }
}

// ===========================================================================
// Concurrent queue mutation stays consistent
// ===========================================================================

TEST(ConcurrentDispatchTest, ParallelEnqueueAcrossTeams) {
    constexpr int NUM_TEAMS = 4;
    constexpr int TASKS_PER_TEAM = 100;

    TaskQueueManager q;
    std::vector<std::thread> threads;
    for (int team = 0; team < NUM_TEAMS; ++team) {
        threads.emplace_back([&, team]() {
            for (int i = 0; i < TASKS_PER_TEAM; ++i) {
                RoutingContext ctx;
                ctx.team_id = "team-" + std::to_string(team);
                q.enqueue(ctx.team_id.value() + "-" + std::to_string(i), ctx,
                          (i % 4) * 25);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(q.total_length(), static_cast<std::size_t>(NUM_TEAMS * TASKS_PER_TEAM));
    for (int team = 0; team < NUM_TEAMS; ++team) {
        auto tasks = q.tasks("team-" + std::to_string(team));
        ASSERT_EQ(tasks.size(), static_cast<std::size_t>(TASKS_PER_TEAM));
        for (std::size_t i = 1; i < tasks.size(); ++i) {
            EXPECT_GE(tasks[i - 1].priority, tasks[i].priority);
        }
    }
}

TEST(ConcurrentDispatchTest, ConcurrentResumeAssignsEachTaskOnce) {
    auto agents = std::make_shared<AgentDirectory>();
    auto rules = std::make_shared<RuleStore>();
    auto queue = std::make_shared<TaskQueueManager>();
    DispatchEngine engine(agents, rules, queue);

    constexpr int NUM_TASKS = 40;
    for (int i = 0; i < NUM_TASKS; ++i) {
        auto d = engine.route(general_task("t" + std::to_string(i)));
        ASSERT_EQ(d.outcome, RoutingOutcome::Queued);
    }

    // Workers come online with enough total capacity for every task
    auto pool = make_pool(4, 10);
    for (const auto& a : pool->all()) agents->upsert(a);

    std::atomic<int> resumed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            resumed += static_cast<int>(engine.resume_queued("default").size());
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(resumed.load(), NUM_TASKS);
    EXPECT_EQ(queue->length("default"), 0u);

    int total_load = 0;
    for (const auto& a : agents->all()) total_load += a.current_task_count;
    EXPECT_EQ(total_load, NUM_TASKS);
}
