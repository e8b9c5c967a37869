#include "queue/priority_queue.hpp"
#include "errors.hpp"
#include "queue/bounded_queue.hpp"
#include "queue/unbounded_queue.hpp"
#include <iterator>
#include <stdexcept>
#include <utility>

namespace jobqueue::queue {

std::unique_ptr<IQueue> PriorityQueue::CreateQueue(const QueueOptions &options) {
    if (options.bounded) {
        if (!options.capacity.has_value() || options.capacity.value() <= 0) {
            throw std::invalid_argument("Bounded queue requires a positive capacity.");
        }
        return std::make_unique<BoundedQueue>(options.capacity.value());
    } else {
        return std::make_unique<UnboundedQueue>();
    }
}

PriorityQueue::PriorityQueue(const std::unordered_map<TaskPriority, QueueOptions> &priority_to_options) {
    if (priority_to_options.empty()) {
        throw std::invalid_argument("At least one priority lane must be configured.");
    }
    for (const auto &[priority, options] : priority_to_options) {
        queues_by_priority_[priority] = CreateQueue(options);
    }
}

IQueue &PriorityQueue::LaneFor(TaskPriority priority) const {
    auto it = queues_by_priority_.find(priority);
    if (it == queues_by_priority_.end()) {
        throw std::invalid_argument("Queue for given priority does not exist.");
    }
    return *it->second;
}

EnqueueStatus PriorityQueue::push(Task &&task) {
    std::unique_lock<std::mutex> lock(mutex_);

    IQueue &lane = LaneFor(task.priority);

    // Backpressure: ждём освобождения места или остановки
    cv_space_available_.wait(lock, [this, &lane] { return is_shutdown_ || !lane.full(); });
    if (is_shutdown_) {
        return EnqueueStatus::Shutdown;
    }

    lane.push(std::move(task));
    ++num_total_tasks_;

    lock.unlock();
    cv_tasks_available_.notify_one();
    return EnqueueStatus::Ok;
}

std::optional<Task> PriorityQueue::PopLocked() {
    if (num_total_tasks_ == 0) {
        return std::nullopt;
    }

    for (auto &[priority, queue] : queues_by_priority_) {
        auto task_opt = queue->try_pop();
        if (task_opt.has_value()) {
            --num_total_tasks_;
            return task_opt;
        }
    }

    // Счётчик говорит, что задачи есть, а полосы пусты
    throw InvariantViolation("Priority queue counter reports " + std::to_string(num_total_tasks_) +
                             " tasks but all lanes are empty");
}

std::optional<Task> PriorityQueue::try_pop() {
    std::optional<Task> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task = PopLocked();
    }
    if (task.has_value()) {
        cv_space_available_.notify_all();  // Сообщаем, что освободилось место
    }
    return task;
}

std::optional<Task> PriorityQueue::pop_for(std::chrono::milliseconds idle_wait) {
    std::optional<Task> task;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_tasks_available_.wait_for(lock, idle_wait, [this] { return is_shutdown_ || num_total_tasks_ > 0; });
        // После остановки задачи остаются в полосах до drain()
        if (is_shutdown_) {
            return std::nullopt;
        }
        task = PopLocked();
    }
    if (task.has_value()) {
        cv_space_available_.notify_all();
    }
    return task;
}

std::optional<Task> PriorityQueue::extract(const std::string &task_id) {
    std::optional<Task> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &[priority, queue] : queues_by_priority_) {
            task = queue->extract(task_id);
            if (task.has_value()) {
                --num_total_tasks_;
                break;
            }
        }
    }
    if (task.has_value()) {
        cv_space_available_.notify_all();
    }
    return task;
}

std::vector<Task> PriorityQueue::drain() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &[priority, queue] : queues_by_priority_) {
            auto lane_tasks = queue->drain();
            tasks.insert(tasks.end(), std::make_move_iterator(lane_tasks.begin()),
                         std::make_move_iterator(lane_tasks.end()));
        }
        if (tasks.size() != num_total_tasks_) {
            throw InvariantViolation("Priority queue counter reports " + std::to_string(num_total_tasks_) +
                                     " tasks but lanes held " + std::to_string(tasks.size()));
        }
        num_total_tasks_ = 0;
    }
    cv_space_available_.notify_all();
    return tasks;
}

void PriorityQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        is_shutdown_ = true;
    }
    cv_tasks_available_.notify_all();
    cv_space_available_.notify_all();
}

bool PriorityQueue::is_shutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_shutdown_;
}

bool PriorityQueue::has_lane(TaskPriority priority) const {
    return queues_by_priority_.count(priority) > 0;  // Набор полос не меняется после конструктора
}

size_t PriorityQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return num_total_tasks_;
}

std::map<TaskPriority, size_t> PriorityQueue::lane_sizes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<TaskPriority, size_t> sizes;
    for (const auto &[priority, queue] : queues_by_priority_) {
        sizes[priority] = queue->size();
    }
    return sizes;
}

PriorityQueue::~PriorityQueue() { shutdown(); }

}  // namespace jobqueue::queue
