#pragma once

#include "skillroute/agent.hpp"

#include <optional>
#include <shared_mutex>
#include <vector>

namespace skillroute {

// In-memory registry of worker profiles.
//
// Reads take a shared lock and return copies, so a caller never observes a
// profile half-way through an update. The directory emits no events.
class AgentDirectory {
public:
    AgentDirectory() = default;

    AgentDirectory(const AgentDirectory&) = delete;
    AgentDirectory& operator=(const AgentDirectory&) = delete;

    // ==================== Registration ====================

    // Insert or replace by id. Throws InvalidAgentProfileException for an
    // empty id, non-positive max_concurrent_tasks or negative task count.
    void upsert(AgentProfile profile);

    // Idempotent. Returns whether a profile was removed. In-flight work of the
    // removed worker is the caller's to reassign.
    bool remove(const AgentId& id);

    void clear();

    // ==================== Queries ====================

    std::vector<AgentProfile> all() const;

    // Workers with availability == Available, optionally restricted to a team
    std::vector<AgentProfile> available(const std::optional<TeamId>& team_id = std::nullopt) const;

    std::optional<AgentProfile> by_id(const AgentId& id) const;

    // Workers holding an active entry for skill_id at or above min_proficiency
    std::vector<AgentProfile> by_skill(
        const SkillId& skill_id,
        std::optional<ProficiencyLevel> min_proficiency = std::nullopt) const;

    std::size_t size() const;

    // ==================== Updates ====================

    // Both refresh updated_at; unknown ids are ignored.
    void set_availability(const AgentId& id, Availability value);
    void set_task_count(const AgentId& id, std::int32_t value);

    // Compare-and-increment: takes one task slot only if the worker is
    // available and below max_concurrent_tasks * ratio.
    bool try_acquire_task_slot(const AgentId& id, double ratio = 1.0);

    // Gives back one task slot (never below zero). Unknown ids are ignored.
    void release_task_slot(const AgentId& id);

private:
    mutable std::shared_mutex mutex_;

    // Insertion order is kept so listings are deterministic
    std::vector<AgentProfile> agents_;

    AgentProfile* find_locked(const AgentId& id);
    const AgentProfile* find_locked(const AgentId& id) const;
};

} // namespace skillroute
