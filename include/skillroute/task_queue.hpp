#pragma once

#include "skillroute/types.hpp"
#include "skillroute/config.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace skillroute {

// Per-team priority queues for tasks waiting on an eligible worker.
//
// Mutations of one queue are serialized by that queue's lock; different
// queues proceed independently. A task lives in exactly one queue.
class TaskQueueManager {
public:
    explicit TaskQueueManager(QueueConfig config = QueueConfig{});

    TaskQueueManager(const TaskQueueManager&) = delete;
    TaskQueueManager& operator=(const TaskQueueManager&) = delete;

    // Idempotent creation.
    void ensure_queue(const QueueId& queue_id);

    // Queue identity: context.team_id if present, else the default queue.
    QueueId queue_for(const RoutingContext& context) const;

    // Inserts after every task of equal or higher priority. Re-enqueueing a
    // task that is already queued returns its current placement unchanged.
    // Throws QueueFullException when the target queue is at capacity.
    EnqueueResult enqueue(const TaskId& task_id, const RoutingContext& context,
                          Priority priority);

    // Highest-priority task id, or nullopt for an empty or unknown queue.
    std::optional<TaskId> dequeue(const QueueId& queue_id);

    // Head of the queue without removing it.
    std::optional<QueuedTask> peek(const QueueId& queue_id) const;

    // Queue currently holding the task, or nullopt if it is not queued.
    std::optional<QueueId> queue_of(const TaskId& task_id) const;

    // Current 1-indexed rank, or nullopt if the task is not queued.
    std::optional<std::size_t> position(const TaskId& task_id) const;

    // length * average_handling_seconds; 0 for an empty or unknown queue.
    std::int64_t estimated_wait_seconds(const QueueId& queue_id) const;

    // Cancellation. Returns false if the task is not queued.
    bool remove(const TaskId& task_id);

    std::size_t length(const QueueId& queue_id) const;
    std::size_t total_length() const;

    // Ordered snapshot (head first). Empty for an unknown queue.
    std::vector<QueuedTask> tasks(const QueueId& queue_id) const;

    // Tasks that have waited at least `max_wait`. Nothing is removed.
    std::vector<QueuedTask> waiting_longer_than(const QueueId& queue_id,
                                                Duration max_wait) const;

    std::vector<QueueId> queue_ids() const;

    void clear();

    const QueueConfig& config() const noexcept;

private:
    struct TaskQueue {
        mutable std::mutex mutex;
        // Sorted: priority desc, then arrival
        std::vector<QueuedTask> tasks;
        // Set by clear(); a retired queue no longer accepts tasks
        bool retired{false};
    };

    QueueConfig config_;

    // Lock order: queues_mutex_ -> TaskQueue::mutex -> index_mutex_
    mutable std::shared_mutex queues_mutex_;
    std::map<QueueId, std::shared_ptr<TaskQueue>> queues_;

    mutable std::mutex index_mutex_;
    std::unordered_map<TaskId, QueueId> index_;

    std::shared_ptr<TaskQueue> find_queue(const QueueId& queue_id) const;
    std::shared_ptr<TaskQueue> get_or_create(const QueueId& queue_id);
    std::optional<QueueId> indexed_queue(const TaskId& task_id) const;

    static std::optional<std::size_t> rank_of(const std::vector<QueuedTask>& tasks,
                                              const TaskId& task_id);
};

} // namespace skillroute
