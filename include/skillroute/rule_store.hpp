#pragma once

#include "skillroute/types.hpp"

#include <optional>
#include <shared_mutex>
#include <vector>

namespace skillroute {

// In-memory registry of prioritized routing rules.
class RuleStore {
public:
    RuleStore() = default;

    RuleStore(const RuleStore&) = delete;
    RuleStore& operator=(const RuleStore&) = delete;

    // Insert or replace by id. A replaced rule keeps its insertion position,
    // which breaks priority ties. Throws InvalidRoutingRuleException on an
    // empty id.
    void upsert(RoutingRule rule);

    // Idempotent. Returns whether a rule was removed.
    bool remove(const RuleId& id);

    void clear();

    std::vector<RoutingRule> all() const;

    // Active rules, highest priority first, ties in insertion order
    std::vector<RoutingRule> active() const;

    std::optional<RoutingRule> by_id(const RuleId& id) const;

    // Active rules compatible with every dimension present in `query`,
    // ordered like active(). Rule time windows are checked against `at`
    // when given and do not constrain the match otherwise.
    std::vector<RoutingRule> matching(const RuleConditions& query,
                                      std::optional<WallTime> at = std::nullopt) const;

    std::size_t size() const;

    // True when `rule` constrains no dimension of `query` incompatibly.
    // Procedure types compare case-insensitively.
    static bool conditions_match(const RuleConditions& rule, const RuleConditions& query,
                                 std::optional<WallTime> at = std::nullopt);

    // Local hour and weekday of `at` fall inside `range`
    static bool within(const TimeRange& range, WallTime at);

private:
    mutable std::shared_mutex mutex_;
    std::vector<RoutingRule> rules_;

    std::vector<RoutingRule> active_locked() const;
};

} // namespace skillroute
