#include "queue/bounded_queue.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace jobqueue::queue {

BoundedQueue::BoundedQueue(int capacity)
    : capacity_(capacity > 0 ? capacity : throw std::invalid_argument("Capacity must be positive")) {}

void BoundedQueue::push(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(queue_.size()) >= capacity_) {
        throw InvariantViolation("Push into a full bounded lane (capacity " + std::to_string(capacity_) + ")");
    }
    queue_.push_back(std::move(task));
}

std::optional<Task> BoundedQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto task = std::move(queue_.front());
    queue_.pop_front();
    return task;
}

std::optional<Task> BoundedQueue::extract(const std::string &task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(queue_.begin(), queue_.end(), [&task_id](const Task &t) { return t.id == task_id; });
    if (it == queue_.end()) {
        return std::nullopt;
    }
    auto task = std::move(*it);
    queue_.erase(it);
    return task;
}

std::vector<Task> BoundedQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task> tasks(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
    queue_.clear();
    return tasks;
}

bool BoundedQueue::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(queue_.size()) >= capacity_;
}

size_t BoundedQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

BoundedQueue::~BoundedQueue() {}

}  // namespace jobqueue::queue
