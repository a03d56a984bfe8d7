#include "skillroute/monitor.hpp"

#include <iomanip>
#include <iostream>

namespace skillroute {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::RouteRequested:    return "RouteRequested";
        case EventType::RuleMatched:       return "RuleMatched";
        case EventType::NoRuleMatched:     return "NoRuleMatched";
        case EventType::TaskAssigned:      return "TaskAssigned";
        case EventType::TaskQueued:        return "TaskQueued";
        case EventType::TaskEscalated:     return "TaskEscalated";
        case EventType::ReassignAttempted: return "ReassignAttempted";
        case EventType::CapacityRaceLost:  return "CapacityRaceLost";
        case EventType::QueueFull:         return "QueueFull";
        case EventType::TaskResumed:       return "TaskResumed";
        case EventType::TaskCancelled:     return "TaskCancelled";
        case EventType::TaskReleased:      return "TaskReleased";
        case EventType::QueueSizeChanged:  return "QueueSizeChanged";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::TaskAssigned:
        case EventType::TaskQueued:
        case EventType::TaskEscalated:
        case EventType::QueueFull:
        case EventType::TaskResumed:
        case EventType::TaskCancelled:
            return true;
        default:
            return false;
    }
}

bool is_debug_event(EventType t) {
    return t == EventType::CapacityRaceLost || t == EventType::QueueSizeChanged;
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && is_debug_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[SkillRoute] " << to_string(event.type);

    if (event.decision_id.has_value()) {
        std::cout << " decision=" << event.decision_id.value();
    }
    if (event.task_id.has_value()) {
        std::cout << " task=" << event.task_id.value();
    }
    if (event.agent_id.has_value()) {
        std::cout << " agent=" << event.agent_id.value();
    }
    if (event.queue_id.has_value()) {
        std::cout << " queue=" << event.queue_id.value();
    }
    if (event.rule_id.has_value()) {
        std::cout << " rule=" << event.rule_id.value();
    }
    if (event.score.has_value()) {
        std::cout << " score=" << std::fixed << std::setprecision(2) << event.score.value();
    }
    if (event.queue_length.has_value()) {
        std::cout << " length=" << event.queue_length.value();
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    AlertCallback alert;
    std::string alert_message;

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        switch (event.type) {
            case EventType::RouteRequested:
                metrics_.total_routed++;
                break;
            case EventType::TaskAssigned:
                metrics_.assigned++;
                if (event.score.has_value()) {
                    score_sample_count_++;
                    score_sum_ += event.score.value();
                    metrics_.average_match_score = score_sum_ / score_sample_count_;
                }
                break;
            case EventType::TaskQueued:
                metrics_.queued++;
                break;
            case EventType::TaskEscalated:
                metrics_.escalated++;
                break;
            case EventType::ReassignAttempted:
                metrics_.reassign_attempts++;
                break;
            case EventType::CapacityRaceLost:
                metrics_.capacity_races_lost++;
                break;
            case EventType::TaskResumed:
                metrics_.resumed++;
                break;
            case EventType::TaskCancelled:
                metrics_.cancelled++;
                break;
            case EventType::TaskReleased:
                metrics_.released++;
                break;
            default:
                break;
        }

        if (event.queue_length.has_value()) {
            metrics_.last_queue_length = event.queue_length.value();
            if (queue_size_cb_ && metrics_.last_queue_length > queue_size_threshold_) {
                alert = queue_size_cb_;
                alert_message = "Queue size " + std::to_string(metrics_.last_queue_length) +
                                " exceeds threshold " + std::to_string(queue_size_threshold_);
            }
        }
    }

    // Outside the lock so the callback may query get_metrics()
    if (alert) alert(alert_message);
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    score_sample_count_ = 0;
    score_sum_ = 0.0;
}

void MetricsMonitor::set_queue_size_alert_threshold(std::size_t threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    queue_size_threshold_ = threshold;
    queue_size_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

} // namespace skillroute
