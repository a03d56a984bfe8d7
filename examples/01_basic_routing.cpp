// 01_basic_routing.cpp
//
// Minimal SkillRoute example: three front-desk staff, two routing rules.
// Shows how a request is matched to the best-qualified available worker
// and what happens when nobody is free.
//
// Scenario:
//   - Dana is an implant coordinator, Lee handles cosmetic cases, Sam
//     covers general dentistry.
//   - A rule forces voice calls about implants to an Advanced coordinator.
//   - Once Dana is busy, the next implant call is queued, then resumed
//     when Dana finishes.

#include <skillroute/skillroute.hpp>

#include <iostream>
#include <string>

using namespace skillroute;

static void print_decision(const RoutingDecision& d) {
    std::cout << "  task " << d.task_id << " -> " << to_string(d.outcome);
    if (d.selected_agent_id) std::cout << " (" << *d.selected_agent_id << ")";
    if (d.queue_id) {
        std::cout << " queue=" << *d.queue_id
                  << " position=" << d.queue_position.value_or(0)
                  << " wait=" << d.estimated_wait_seconds.value_or(0) << "s";
    }
    std::cout << "\n    " << d.reasoning << "\n\n";
}

int main() {
    std::cout << "=== SkillRoute: Basic Routing Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the components and the engine.
    // ----------------------------------------------------------------
    auto agents = std::make_shared<AgentDirectory>();
    auto rules = std::make_shared<RuleStore>();
    auto queue = std::make_shared<TaskQueueManager>();
    DispatchEngine engine(agents, rules, queue);

    // Attach a console monitor so we can see what happens internally.
    engine.set_monitor(
        std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Register staff.
    // ----------------------------------------------------------------
    AgentProfile dana;
    dana.id = "dana";
    dana.name = "Dana";
    dana.availability = Availability::Available;
    dana.skills = {{"procedure:implants", ProficiencyLevel::Advanced, true}};
    dana.languages = {"en", "es"};
    agents->upsert(dana);

    AgentProfile lee;
    lee.id = "lee";
    lee.name = "Lee";
    lee.availability = Availability::Available;
    lee.skills = {{"procedure:cosmetic", ProficiencyLevel::Expert, true},
                  {"procedure:implants", ProficiencyLevel::Basic, true}};
    agents->upsert(lee);

    AgentProfile sam;
    sam.id = "sam";
    sam.name = "Sam";
    sam.availability = Availability::Available;
    sam.max_concurrent_tasks = 3;
    sam.skills = {{"procedure:general-dentistry", ProficiencyLevel::Intermediate, true}};
    agents->upsert(sam);

    std::cout << "Registered " << agents->size() << " staff members.\n\n";

    // ----------------------------------------------------------------
    // 3. Routing rules.
    // ----------------------------------------------------------------
    RoutingRule implant_calls;
    implant_calls.id = "implant-calls";
    implant_calls.name = "Implant phone calls";
    implant_calls.priority = 80;
    implant_calls.conditions.procedure_types = std::vector<std::string>{"implants"};
    implant_calls.conditions.channels = std::vector<Channel>{Channel::Voice};
    implant_calls.routing.skill_requirements = {
        {"procedure:implants", ProficiencyLevel::Advanced, RequirementKind::Required}};
    implant_calls.routing.fallback_behavior = FallbackBehavior::Queue;
    rules->upsert(implant_calls);

    RoutingRule balance;
    balance.id = "balance-general";
    balance.name = "Balance general dentistry";
    balance.priority = 10;
    balance.conditions.procedure_types = std::vector<std::string>{"general"};
    balance.routing.strategy = RoutingStrategy::LeastOccupied;
    rules->upsert(balance);

    // ----------------------------------------------------------------
    // 4. Route some work.
    // ----------------------------------------------------------------
    RoutingContext call;
    call.task_id = "call-1";
    call.channel = Channel::Voice;
    call.procedure_type = "implants";
    call.preferred_languages = {"es"};

    std::cout << "Implant call #1:\n";
    print_decision(engine.route(call));

    std::cout << "Implant call #2 (Dana is now busy):\n";
    call.task_id = "call-2";
    auto queued = engine.route(call);
    print_decision(queued);

    RoutingContext checkup;
    checkup.task_id = "web-1";
    checkup.channel = Channel::Web;
    checkup.procedure_type = "general";
    checkup.required_skills = {
        {"procedure:general-dentistry", ProficiencyLevel::Basic, RequirementKind::Required}};

    std::cout << "General checkup request:\n";
    print_decision(engine.route(checkup));

    // ----------------------------------------------------------------
    // 5. Dana finishes; resume the queue.
    // ----------------------------------------------------------------
    engine.release("dana");
    std::cout << "Dana finished call-1. Resuming queue '"
              << queued.queue_id.value_or("default") << "'...\n";
    for (const auto& d : engine.resume_queued(queued.queue_id.value_or("default"))) {
        print_decision(d);
    }

    std::cout << "Tasks still queued: " << queue->total_length() << "\n";
    std::cout << "\n=== Example complete ===\n";
    return 0;
}
