#include "queue/unbounded_queue.hpp"
#include <algorithm>
#include <iterator>
#include <utility>

namespace jobqueue::queue {

UnboundedQueue::UnboundedQueue() {}

void UnboundedQueue::push(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(task));  // Добавляем задачу в конец полосы
}

std::optional<Task> UnboundedQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }

    auto task = std::move(queue_.front());  // Извлекаем задачу
    queue_.pop_front();
    return task;
}

std::optional<Task> UnboundedQueue::extract(const std::string &task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(queue_.begin(), queue_.end(), [&task_id](const Task &t) { return t.id == task_id; });
    if (it == queue_.end()) {
        return std::nullopt;
    }
    auto task = std::move(*it);
    queue_.erase(it);
    return task;
}

std::vector<Task> UnboundedQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task> tasks(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
    queue_.clear();
    return tasks;
}

size_t UnboundedQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}  // namespace jobqueue::queue
