#include "task_tracker.hpp"
#include "errors.hpp"
#include <stdexcept>

namespace jobqueue {

const char *ToString(TaskState state) {
    switch (state) {
    case TaskState::Pending:
        return "pending";
    case TaskState::Scheduled:
        return "scheduled";
    case TaskState::Running:
        return "running";
    case TaskState::Retrying:
        return "retrying";
    case TaskState::Completed:
        return "completed";
    case TaskState::DeadLettered:
        return "dead_lettered";
    case TaskState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

bool IsFinished(TaskState state) {
    return state == TaskState::Completed || state == TaskState::DeadLettered || state == TaskState::Cancelled;
}

TaskTracker::TaskTracker(Clock::duration retention) : retention_(retention) {
    if (retention_ < Clock::duration::zero()) {
        throw std::invalid_argument("Finished task retention must be non-negative");
    }
}

void TaskTracker::RecordLocked(const std::string &task_id, Entry &entry, TaskState state) {
    entry.state = state;
    entry.updated_at = Clock::now();
    if (IsFinished(state) && retention_ > Clock::duration::zero()) {
        finished_order_.emplace_back(task_id, entry.updated_at);
    }
}

void TaskTracker::track(const std::string &task_id, TaskState initial) {
    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = entries_.emplace(task_id, Entry{initial, Clock::now()});
        if (!inserted) {
            throw InvariantViolation("Task " + task_id + " is already tracked in state " + ToString(it->second.state));
        }
        RecordLocked(task_id, it->second, initial);
        finished = IsFinished(initial);
    }
    if (finished) {
        cv_finished_.notify_all();
    }
}

void TaskTracker::transition(const std::string &task_id, TaskState from, TaskState to) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(task_id);
        if (it == entries_.end()) {
            throw InvariantViolation("Transition of unknown task " + task_id + " to " + ToString(to));
        }
        if (it->second.state != from) {
            throw InvariantViolation("Task " + task_id + " expected in state " + ToString(from) + " but is " +
                                     ToString(it->second.state) + " (moving to " + ToString(to) + ")");
        }
        RecordLocked(task_id, it->second, to);
    }
    if (IsFinished(to)) {
        cv_finished_.notify_all();
    }
}

void TaskTracker::forget(const std::string &task_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(task_id);
    }
    // Ожидающие wait_finished() должны увидеть, что задачи больше нет
    cv_finished_.notify_all();
}

std::optional<TaskState> TaskTracker::state(const std::string &task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(task_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

std::optional<TaskState> TaskTracker::wait_finished(const std::string &task_id,
                                                     std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    std::optional<TaskState> current;
    cv_finished_.wait_for(lock, timeout, [this, &task_id, &current] {
        auto it = entries_.find(task_id);
        if (it == entries_.end()) {
            current.reset();
            return true;
        }
        current = it->second.state;
        return IsFinished(it->second.state);
    });
    return current;
}

size_t TaskTracker::count(TaskState state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t result = 0;
    for (const auto &[id, entry] : entries_) {
        if (entry.state == state) {
            ++result;
        }
    }
    return result;
}

std::vector<std::string> TaskTracker::ids_in_state(TaskState state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto &[id, entry] : entries_) {
        if (entry.state == state) {
            ids.push_back(id);
        }
    }
    return ids;
}

size_t TaskTracker::cleanup_finished(Clock::duration older_than) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = Clock::now() - older_than;
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (IsFinished(it->second.state) && it->second.updated_at <= cutoff) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t TaskTracker::prune_expired() {
    if (retention_ == Clock::duration::zero()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = Clock::now() - retention_;
    size_t removed = 0;
    // Очередь упорядочена по времени завершения: достаточно смотреть на голову
    while (!finished_order_.empty() && finished_order_.front().second <= cutoff) {
        const auto &[task_id, finished_at] = finished_order_.front();
        auto it = entries_.find(task_id);
        // Запись могла быть удалена cleanup_finished() или forget()
        if (it != entries_.end() && IsFinished(it->second.state) && it->second.updated_at == finished_at) {
            entries_.erase(it);
            ++removed;
        }
        finished_order_.pop_front();
    }
    return removed;
}

}  // namespace jobqueue
