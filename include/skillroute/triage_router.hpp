#pragma once

#include "skillroute/types.hpp"
#include "skillroute/triage.hpp"
#include "skillroute/config.hpp"
#include "skillroute/dispatch_engine.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace skillroute {

struct TriageRoutingResult {
    TriageResult                   triage_result;
    RoutingContext                 context;
    // Absent for triage_only()
    std::optional<RoutingDecision> decision;
};

// Turns an external triage assessment into a routing request and hands it to
// the dispatch engine.
class TriageRouter {
public:
    // Throws MissingCollaboratorException if either collaborator is null.
    TriageRouter(std::shared_ptr<TriageAssessor> assessor,
                 std::shared_ptr<DispatchEngine> engine,
                 TriageRoutingConfig config = TriageRoutingConfig{});

    TriageRouter(const TriageRouter&) = delete;
    TriageRouter& operator=(const TriageRouter&) = delete;

    // Assess, map and dispatch. Exceptions from the assessor propagate.
    TriageRoutingResult route(const TriageInput& input);

    // Assess and map without dispatching (preview/estimation).
    TriageRoutingResult triage_only(const TriageInput& input);

    // Replaces the skills for `procedure` (matched case-insensitively).
    void update_procedure_mapping(const std::string& procedure, std::vector<SkillId> skills);

    // Snapshot of the mapping tables
    TriageRoutingConfig config() const;

    // ==================== Mapping ====================

    static Channel map_channel(LeadChannel channel);
    static UrgencyLevel map_urgency(TriageUrgency urgency);

    // Unrecognized recommendations get default_sla_minutes
    std::int64_t sla_minutes(const std::string& recommendation) const;

    RoutingContext build_context(const TriageInput& input, const TriageResult& result,
                                 bool vip) const;

private:
    std::shared_ptr<TriageAssessor> assessor_;
    std::shared_ptr<DispatchEngine> engine_;

    mutable std::shared_mutex config_mutex_;
    TriageRoutingConfig config_;

    TriageRoutingResult assess(const TriageInput& input);
};

} // namespace skillroute
