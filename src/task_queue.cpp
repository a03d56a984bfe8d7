#include "skillroute/task_queue.hpp"
#include "skillroute/exceptions.hpp"

#include <algorithm>

namespace skillroute {

TaskQueueManager::TaskQueueManager(QueueConfig config)
    : config_(std::move(config))
{}

void TaskQueueManager::ensure_queue(const QueueId& queue_id) {
    get_or_create(queue_id);
}

QueueId TaskQueueManager::queue_for(const RoutingContext& context) const {
    if (context.team_id.has_value() && !context.team_id->empty()) {
        return *context.team_id;
    }
    return config_.default_queue_id;
}

EnqueueResult TaskQueueManager::enqueue(const TaskId& task_id, const RoutingContext& context,
                                        Priority priority) {
    QueueId queue_id = queue_for(context);
    std::optional<QueueId> elsewhere;

    for (;;) {
        auto queue = get_or_create(queue_id);
        std::unique_lock qlock(queue->mutex);
        if (queue->retired) continue;  // Raced with clear(); use the fresh queue

        {
            std::lock_guard<std::mutex> ilock(index_mutex_);
            auto it = index_.find(task_id);
            if (it != index_.end()) {
                if (it->second == queue_id) {
                    auto rank = rank_of(queue->tasks, task_id);
                    return EnqueueResult{queue_id, rank.value_or(0)};
                }
                elsewhere = it->second;
            } else {
                if (queue->tasks.size() >= config_.max_queue_size) {
                    throw QueueFullException(queue_id, config_.max_queue_size);
                }
                index_.emplace(task_id, queue_id);
            }
        }
        if (elsewhere.has_value()) break;

        QueuedTask task;
        task.task_id = task_id;
        task.enqueued_at = Clock::now();
        task.priority = priority;
        task.context = context;
        task.queue_id = queue_id;

        // First task with strictly lower priority; equal priorities stay FIFO
        auto pos = std::upper_bound(queue->tasks.begin(), queue->tasks.end(), priority,
            [](Priority p, const QueuedTask& t) { return p > t.priority; });
        auto inserted = queue->tasks.insert(pos, std::move(task));
        return EnqueueResult{queue_id,
            static_cast<std::size_t>(inserted - queue->tasks.begin()) + 1};
    }

    // Already waiting in another queue (its context named a different team)
    return EnqueueResult{*elsewhere, position(task_id).value_or(0)};
}

std::optional<TaskId> TaskQueueManager::dequeue(const QueueId& queue_id) {
    auto queue = find_queue(queue_id);
    if (!queue) return std::nullopt;

    std::unique_lock qlock(queue->mutex);
    if (queue->tasks.empty()) return std::nullopt;

    TaskId id = std::move(queue->tasks.front().task_id);
    queue->tasks.erase(queue->tasks.begin());

    std::lock_guard<std::mutex> ilock(index_mutex_);
    index_.erase(id);
    return id;
}

std::optional<QueuedTask> TaskQueueManager::peek(const QueueId& queue_id) const {
    auto queue = find_queue(queue_id);
    if (!queue) return std::nullopt;

    std::lock_guard<std::mutex> qlock(queue->mutex);
    if (queue->tasks.empty()) return std::nullopt;
    return queue->tasks.front();
}

std::optional<QueueId> TaskQueueManager::queue_of(const TaskId& task_id) const {
    return indexed_queue(task_id);
}

std::optional<std::size_t> TaskQueueManager::position(const TaskId& task_id) const {
    auto queue_id = indexed_queue(task_id);
    if (!queue_id) return std::nullopt;

    auto queue = find_queue(*queue_id);
    if (!queue) return std::nullopt;

    std::lock_guard<std::mutex> qlock(queue->mutex);
    return rank_of(queue->tasks, task_id);
}

std::int64_t TaskQueueManager::estimated_wait_seconds(const QueueId& queue_id) const {
    return static_cast<std::int64_t>(length(queue_id)) * config_.average_handling_seconds;
}

bool TaskQueueManager::remove(const TaskId& task_id) {
    auto queue_id = indexed_queue(task_id);
    if (!queue_id) return false;

    auto queue = find_queue(*queue_id);
    if (!queue) return false;

    std::unique_lock qlock(queue->mutex);
    std::lock_guard<std::mutex> ilock(index_mutex_);

    // Re-check under both locks: a concurrent dequeue may have taken it
    auto idx = index_.find(task_id);
    if (idx == index_.end() || idx->second != *queue_id) return false;

    auto it = std::find_if(queue->tasks.begin(), queue->tasks.end(),
        [&task_id](const QueuedTask& t) { return t.task_id == task_id; });
    if (it == queue->tasks.end()) return false;

    queue->tasks.erase(it);
    index_.erase(idx);
    return true;
}

std::size_t TaskQueueManager::length(const QueueId& queue_id) const {
    auto queue = find_queue(queue_id);
    if (!queue) return 0;
    std::lock_guard<std::mutex> qlock(queue->mutex);
    return queue->tasks.size();
}

std::size_t TaskQueueManager::total_length() const {
    std::lock_guard<std::mutex> ilock(index_mutex_);
    return index_.size();
}

std::vector<QueuedTask> TaskQueueManager::tasks(const QueueId& queue_id) const {
    auto queue = find_queue(queue_id);
    if (!queue) return {};
    std::lock_guard<std::mutex> qlock(queue->mutex);
    return queue->tasks;
}

std::vector<QueuedTask> TaskQueueManager::waiting_longer_than(const QueueId& queue_id,
                                                              Duration max_wait) const {
    auto queue = find_queue(queue_id);
    if (!queue) return {};

    auto now = Clock::now();
    std::vector<QueuedTask> result;
    std::lock_guard<std::mutex> qlock(queue->mutex);
    for (auto& t : queue->tasks) {
        if (now - t.enqueued_at >= max_wait) {
            result.push_back(t);
        }
    }
    return result;
}

std::vector<QueueId> TaskQueueManager::queue_ids() const {
    std::shared_lock lock(queues_mutex_);
    std::vector<QueueId> ids;
    ids.reserve(queues_.size());
    for (auto& [id, _] : queues_) {
        ids.push_back(id);
    }
    return ids;
}

void TaskQueueManager::clear() {
    std::unique_lock lock(queues_mutex_);
    for (auto& [_, queue] : queues_) {
        std::lock_guard<std::mutex> qlock(queue->mutex);
        queue->tasks.clear();
        queue->retired = true;
    }
    queues_.clear();

    std::lock_guard<std::mutex> ilock(index_mutex_);
    index_.clear();
}

const QueueConfig& TaskQueueManager::config() const noexcept {
    return config_;
}

// ==================== Internal ====================

std::shared_ptr<TaskQueueManager::TaskQueue>
TaskQueueManager::find_queue(const QueueId& queue_id) const {
    std::shared_lock lock(queues_mutex_);
    auto it = queues_.find(queue_id);
    if (it == queues_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<TaskQueueManager::TaskQueue>
TaskQueueManager::get_or_create(const QueueId& queue_id) {
    if (auto existing = find_queue(queue_id)) return existing;

    std::unique_lock lock(queues_mutex_);
    auto& slot = queues_[queue_id];
    if (!slot) {
        slot = std::make_shared<TaskQueue>();
    }
    return slot;
}

std::optional<QueueId> TaskQueueManager::indexed_queue(const TaskId& task_id) const {
    std::lock_guard<std::mutex> ilock(index_mutex_);
    auto it = index_.find(task_id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::size_t> TaskQueueManager::rank_of(const std::vector<QueuedTask>& tasks,
                                                     const TaskId& task_id) {
    auto it = std::find_if(tasks.begin(), tasks.end(),
        [&task_id](const QueuedTask& t) { return t.task_id == task_id; });
    if (it == tasks.end()) return std::nullopt;
    return static_cast<std::size_t>(it - tasks.begin()) + 1;
}

} // namespace skillroute
