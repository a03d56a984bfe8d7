#include "skillroute/agent_directory.hpp"
#include "skillroute/exceptions.hpp"

#include <algorithm>
#include <mutex>

namespace skillroute {

// ==================== Registration ====================

void AgentDirectory::upsert(AgentProfile profile) {
    if (profile.id.empty()) {
        throw InvalidAgentProfileException(profile.id, "id must not be empty");
    }
    if (profile.max_concurrent_tasks <= 0) {
        throw InvalidAgentProfileException(profile.id, "max_concurrent_tasks must be positive");
    }
    if (profile.current_task_count < 0) {
        throw InvalidAgentProfileException(profile.id, "current_task_count must not be negative");
    }

    auto now = Clock::now();
    if (profile.created_at == Timestamp{}) profile.created_at = now;
    if (profile.updated_at == Timestamp{}) profile.updated_at = now;

    std::unique_lock lock(mutex_);
    if (auto* existing = find_locked(profile.id)) {
        *existing = std::move(profile);
    } else {
        agents_.push_back(std::move(profile));
    }
}

bool AgentDirectory::remove(const AgentId& id) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(agents_.begin(), agents_.end(),
        [&id](const AgentProfile& a) { return a.id == id; });
    if (it == agents_.end()) return false;
    agents_.erase(it);
    return true;
}

void AgentDirectory::clear() {
    std::unique_lock lock(mutex_);
    agents_.clear();
}

// ==================== Queries ====================

std::vector<AgentProfile> AgentDirectory::all() const {
    std::shared_lock lock(mutex_);
    return agents_;
}

std::vector<AgentProfile> AgentDirectory::available(const std::optional<TeamId>& team_id) const {
    std::shared_lock lock(mutex_);
    std::vector<AgentProfile> result;
    for (auto& a : agents_) {
        if (!a.is_available()) continue;
        if (team_id.has_value() && a.team_id != team_id) continue;
        result.push_back(a);
    }
    return result;
}

std::optional<AgentProfile> AgentDirectory::by_id(const AgentId& id) const {
    std::shared_lock lock(mutex_);
    const auto* a = find_locked(id);
    if (a == nullptr) return std::nullopt;
    return *a;
}

std::vector<AgentProfile> AgentDirectory::by_skill(
    const SkillId& skill_id,
    std::optional<ProficiencyLevel> min_proficiency) const
{
    auto minimum = min_proficiency.value_or(ProficiencyLevel::Basic);

    std::shared_lock lock(mutex_);
    std::vector<AgentProfile> result;
    for (auto& a : agents_) {
        if (a.has_skill(skill_id, minimum)) {
            result.push_back(a);
        }
    }
    return result;
}

std::size_t AgentDirectory::size() const {
    std::shared_lock lock(mutex_);
    return agents_.size();
}

// ==================== Updates ====================

void AgentDirectory::set_availability(const AgentId& id, Availability value) {
    std::unique_lock lock(mutex_);
    auto* a = find_locked(id);
    if (a == nullptr) return;
    a->availability = value;
    a->updated_at = Clock::now();
}

void AgentDirectory::set_task_count(const AgentId& id, std::int32_t value) {
    std::unique_lock lock(mutex_);
    auto* a = find_locked(id);
    if (a == nullptr) return;
    a->current_task_count = std::max<std::int32_t>(value, 0);
    a->updated_at = Clock::now();
}

bool AgentDirectory::try_acquire_task_slot(const AgentId& id, double ratio) {
    std::unique_lock lock(mutex_);
    auto* a = find_locked(id);
    if (a == nullptr || !a->has_capacity(ratio)) return false;
    a->current_task_count++;
    a->updated_at = Clock::now();
    return true;
}

void AgentDirectory::release_task_slot(const AgentId& id) {
    std::unique_lock lock(mutex_);
    auto* a = find_locked(id);
    if (a == nullptr || a->current_task_count == 0) return;
    a->current_task_count--;
    a->updated_at = Clock::now();
}

// ==================== Internal ====================

AgentProfile* AgentDirectory::find_locked(const AgentId& id) {
    auto it = std::find_if(agents_.begin(), agents_.end(),
        [&id](const AgentProfile& a) { return a.id == id; });
    return (it != agents_.end()) ? &*it : nullptr;
}

const AgentProfile* AgentDirectory::find_locked(const AgentId& id) const {
    auto it = std::find_if(agents_.begin(), agents_.end(),
        [&id](const AgentProfile& a) { return a.id == id; });
    return (it != agents_.end()) ? &*it : nullptr;
}

} // namespace skillroute
