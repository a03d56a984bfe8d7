#pragma once

// SkillRoute: Skill-Based Task Routing for Clinic CRM Teams
//
// Matches inbound patient/lead work to the best-qualified available staff
// member, or holds it in a per-team priority queue until someone frees up.

// Core
#include "skillroute/types.hpp"
#include "skillroute/exceptions.hpp"
#include "skillroute/config.hpp"
#include "skillroute/agent.hpp"
#include "skillroute/agent_directory.hpp"
#include "skillroute/rule_store.hpp"
#include "skillroute/task_queue.hpp"
#include "skillroute/strategy.hpp"
#include "skillroute/monitor.hpp"
#include "skillroute/dispatch_engine.hpp"

// Triage integration
#include "skillroute/triage.hpp"
#include "skillroute/triage_router.hpp"
