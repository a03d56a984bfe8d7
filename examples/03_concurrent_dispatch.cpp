// 03_concurrent_dispatch.cpp
//
// Many inbound channels routing at once against a shared staff pool.
//
// Scenario:
//   - Four coordinators, each able to hold two conversations.
//   - Six intake threads (WhatsApp, web, phone...) route leads in parallel
//     and release them after a short "conversation".
//   - Overflow is queued per team and drained by a resume sweep.
//   - At the end, no coordinator ever held more than two conversations.

#include <skillroute/skillroute.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

using namespace skillroute;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== SkillRoute: Concurrent Dispatch Example ===\n\n";

    constexpr int NUM_COORDINATORS = 4;
    constexpr int NUM_CHANNELS = 6;
    constexpr int LEADS_PER_CHANNEL = 15;

    auto agents = std::make_shared<AgentDirectory>();
    auto rules = std::make_shared<RuleStore>();
    auto queue = std::make_shared<TaskQueueManager>();
    DispatchEngine engine(agents, rules, queue);

    auto metrics = std::make_shared<MetricsMonitor>();
    metrics->set_queue_size_alert_threshold(10, [](const std::string& msg) {
        std::cout << "[ALERT] " << msg << "\n";
    });
    engine.set_monitor(metrics);

    for (int i = 0; i < NUM_COORDINATORS; ++i) {
        AgentProfile a;
        a.id = "coordinator-" + std::to_string(i);
        a.name = a.id;
        a.availability = Availability::Available;
        a.max_concurrent_tasks = 2;
        a.team_id = "intake";
        a.skills = {{"customer_service:general", ProficiencyLevel::Advanced, true}};
        agents->upsert(std::move(a));
    }

    RoutingRule balance;
    balance.id = "intake-balance";
    balance.name = "Balance intake";
    balance.routing.strategy = RoutingStrategy::LeastOccupied;
    rules->upsert(balance);

    std::atomic<int> max_seen{0};
    std::vector<std::thread> channels;
    for (int c = 0; c < NUM_CHANNELS; ++c) {
        channels.emplace_back([&, c]() {
            std::mt19937 rng(static_cast<unsigned>(c + 1));
            std::uniform_int_distribution<int> talk_ms(1, 5);

            for (int i = 0; i < LEADS_PER_CHANNEL; ++i) {
                RoutingContext ctx;
                ctx.task_id = "ch" + std::to_string(c) + "-lead" + std::to_string(i);
                ctx.team_id = "intake";
                ctx.priority = (i % 3 == 0) ? PRIORITY_HIGH : PRIORITY_NORMAL;
                ctx.required_skills = {{"customer_service:general", ProficiencyLevel::Basic,
                                        RequirementKind::Required}};

                auto d = engine.route(ctx);
                if (d.outcome != RoutingOutcome::Assigned) continue;

                if (auto a = agents->by_id(*d.selected_agent_id)) {
                    int seen = a->current_task_count;
                    int prev = max_seen.load();
                    while (seen > prev && !max_seen.compare_exchange_weak(prev, seen)) {}
                }

                std::this_thread::sleep_for(std::chrono::milliseconds(talk_ms(rng)));
                engine.release(*d.selected_agent_id);
            }
        });
    }
    for (auto& t : channels) t.join();

    std::cout << "Queued after intake burst: " << queue->length("intake") << "\n";

    // Drain the overflow in rounds, releasing as coordinators finish
    int round = 0;
    while (queue->length("intake") > 0) {
        auto resumed = engine.resume_queued("intake");
        std::cout << "Round " << ++round << ": resumed " << resumed.size() << " leads\n";
        for (const auto& d : resumed) engine.release(*d.selected_agent_id);
        if (resumed.empty()) break;
    }

    auto m = metrics->get_metrics();
    std::cout << "\nRouted:            " << m.total_routed << "\n"
              << "Assigned directly: " << m.assigned - m.resumed << "\n"
              << "Queued:            " << m.queued << "\n"
              << "Resumed:           " << m.resumed << "\n"
              << "Races lost:        " << m.capacity_races_lost << "\n"
              << "Max concurrent per coordinator: " << max_seen.load() << " (limit 2)\n";

    std::cout << "\n=== Example complete ===\n";
    return 0;
}
