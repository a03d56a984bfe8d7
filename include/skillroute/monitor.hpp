#pragma once

#include "skillroute/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace skillroute {

enum class EventType {
    RouteRequested,
    RuleMatched,
    NoRuleMatched,
    TaskAssigned,
    TaskQueued,
    TaskEscalated,
    ReassignAttempted,
    CapacityRaceLost,
    QueueFull,
    TaskResumed,
    TaskCancelled,
    TaskReleased,
    QueueSizeChanged
};

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<DecisionId> decision_id;
    std::optional<TaskId> task_id;
    std::optional<AgentId> agent_id;
    std::optional<QueueId> queue_id;
    std::optional<RuleId> rule_id;
    std::optional<double> score;
    std::optional<std::size_t> queue_length;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Routing metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t total_routed{0};
        std::uint64_t assigned{0};
        std::uint64_t queued{0};
        std::uint64_t escalated{0};
        std::uint64_t reassign_attempts{0};
        std::uint64_t capacity_races_lost{0};
        std::uint64_t resumed{0};
        std::uint64_t cancelled{0};
        std::uint64_t released{0};
        double average_match_score{0.0};
        std::size_t last_queue_length{0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_queue_size_alert_threshold(std::size_t threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    std::size_t queue_size_threshold_{0};
    AlertCallback queue_size_cb_;

    std::uint64_t score_sample_count_{0};
    double score_sum_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

const char* to_string(EventType t);

} // namespace skillroute
