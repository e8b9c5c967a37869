#pragma once

#include "queue/queue.hpp"
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace jobqueue::queue {

// Строгий приоритет между полосами (High, затем Medium, затем Low), FIFO внутри полосы.
// Защиты от голодания Low при постоянной нагрузке High нет.
class PriorityQueue {
private:
    std::map<TaskPriority, std::unique_ptr<IQueue>> queues_by_priority_;  // Обход в порядке приоритета
    mutable std::mutex mutex_;
    std::condition_variable cv_tasks_available_;
    std::condition_variable cv_space_available_;
    bool is_shutdown_ = false;
    size_t num_total_tasks_ = 0;  // Изменяется только под mutex_

    static std::unique_ptr<IQueue> CreateQueue(const QueueOptions &options);
    IQueue &LaneFor(TaskPriority priority) const;
    std::optional<Task> PopLocked();

public:
    explicit PriorityQueue(const std::unordered_map<TaskPriority, QueueOptions> &priority_to_options);

    PriorityQueue(const PriorityQueue &) = delete;
    PriorityQueue &operator=(const PriorityQueue &) = delete;

    // Блокируется, пока полоса заполнена. Задача перемещается только при EnqueueStatus::Ok;
    // при Shutdown она остаётся у вызывающего.
    EnqueueStatus push(Task &&task);

    // Не блокируется: пустой результат означает "сейчас работы нет"
    std::optional<Task> try_pop();

    // Ждёт задачу не дольше idle_wait; просыпается сразу при push.
    // После shutdown() ничего не выдаёт: оставшиеся задачи забирает drain().
    std::optional<Task> pop_for(std::chrono::milliseconds idle_wait);

    std::optional<Task> extract(const std::string &task_id);

    // Забирает все ожидающие задачи в порядке извлечения
    std::vector<Task> drain();

    void shutdown();

    bool is_shutdown() const;

    bool has_lane(TaskPriority priority) const;

    size_t size() const;

    std::map<TaskPriority, size_t> lane_sizes() const;

    ~PriorityQueue();
};

}  // namespace jobqueue::queue
