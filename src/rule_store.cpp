#include "skillroute/rule_store.hpp"
#include "skillroute/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <mutex>

namespace skillroute {

namespace {

// An absent or empty dimension on either side does not constrain the match.
template <typename T>
bool intersects(const std::optional<std::vector<T>>& rule_values,
                const std::optional<std::vector<T>>& query_values) {
    if (!rule_values.has_value() || rule_values->empty()) return true;
    if (!query_values.has_value() || query_values->empty()) return true;
    for (auto& v : *query_values) {
        if (std::find(rule_values->begin(), rule_values->end(), v) != rule_values->end()) {
            return true;
        }
    }
    return false;
}

std::string fold(const std::string& value) {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = value.find_last_not_of(" \t\r\n");
    std::string out = value.substr(first, last - first + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<std::vector<std::string>> folded(
    const std::optional<std::vector<std::string>>& values) {
    if (!values.has_value()) return std::nullopt;
    std::vector<std::string> out;
    out.reserve(values->size());
    for (const auto& v : *values) out.push_back(fold(v));
    return out;
}

bool flag_matches(const std::optional<bool>& rule_flag, const std::optional<bool>& query_flag) {
    if (!rule_flag.has_value() || !query_flag.has_value()) return true;
    return *rule_flag == *query_flag;
}

} // anonymous namespace

void RuleStore::upsert(RoutingRule rule) {
    if (rule.id.empty()) {
        throw InvalidRoutingRuleException(rule.id, "id must not be empty");
    }

    auto now = Clock::now();
    if (rule.created_at == Timestamp{}) rule.created_at = now;
    if (rule.updated_at == Timestamp{}) rule.updated_at = now;

    std::unique_lock lock(mutex_);
    auto it = std::find_if(rules_.begin(), rules_.end(),
        [&rule](const RoutingRule& r) { return r.id == rule.id; });
    if (it != rules_.end()) {
        *it = std::move(rule);
    } else {
        rules_.push_back(std::move(rule));
    }
}

bool RuleStore::remove(const RuleId& id) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(rules_.begin(), rules_.end(),
        [&id](const RoutingRule& r) { return r.id == id; });
    if (it == rules_.end()) return false;
    rules_.erase(it);
    return true;
}

void RuleStore::clear() {
    std::unique_lock lock(mutex_);
    rules_.clear();
}

std::vector<RoutingRule> RuleStore::all() const {
    std::shared_lock lock(mutex_);
    return rules_;
}

std::vector<RoutingRule> RuleStore::active() const {
    std::shared_lock lock(mutex_);
    return active_locked();
}

std::optional<RoutingRule> RuleStore::by_id(const RuleId& id) const {
    std::shared_lock lock(mutex_);
    auto it = std::find_if(rules_.begin(), rules_.end(),
        [&id](const RoutingRule& r) { return r.id == id; });
    if (it == rules_.end()) return std::nullopt;
    return *it;
}

std::vector<RoutingRule> RuleStore::matching(const RuleConditions& query,
                                             std::optional<WallTime> at) const {
    std::shared_lock lock(mutex_);
    auto result = active_locked();
    result.erase(std::remove_if(result.begin(), result.end(),
        [&query, &at](const RoutingRule& r) { return !conditions_match(r.conditions, query, at); }),
        result.end());
    return result;
}

std::size_t RuleStore::size() const {
    std::shared_lock lock(mutex_);
    return rules_.size();
}

bool RuleStore::conditions_match(const RuleConditions& rule, const RuleConditions& query,
                                 std::optional<WallTime> at) {
    if (rule.time_range && at && !within(*rule.time_range, *at)) return false;

    return intersects(folded(rule.procedure_types), folded(query.procedure_types))
        && intersects(rule.urgency_levels, query.urgency_levels)
        && intersects(rule.channels, query.channels)
        && intersects(rule.lead_scores, query.lead_scores)
        && flag_matches(rule.is_vip, query.is_vip)
        && flag_matches(rule.is_existing_patient, query.is_existing_patient);
}

bool RuleStore::within(const TimeRange& range, WallTime at) {
    std::time_t t = WallClock::to_time_t(at);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif

    int hour = local.tm_hour;
    bool in_hours = range.start_hour <= range.end_hour
        ? hour >= range.start_hour && hour < range.end_hour
        : hour >= range.start_hour || hour < range.end_hour;
    if (!in_hours) return false;

    if (range.days_of_week.empty()) return true;
    return std::find(range.days_of_week.begin(), range.days_of_week.end(), local.tm_wday)
        != range.days_of_week.end();
}

std::vector<RoutingRule> RuleStore::active_locked() const {
    std::vector<RoutingRule> result;
    for (auto& r : rules_) {
        if (r.active) result.push_back(r);
    }
    // Stable: equal priorities keep insertion order
    std::stable_sort(result.begin(), result.end(),
        [](const RoutingRule& a, const RoutingRule& b) {
            return a.priority > b.priority;
        });
    return result;
}

} // namespace skillroute
