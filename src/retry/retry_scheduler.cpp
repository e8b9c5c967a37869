#include "retry/retry_scheduler.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace jobqueue::retry {

namespace {

// Компаратор для std::push_heap/pop_heap: на вершине - самая ранняя запись
bool LaterThan(const RetryEntry &a, const RetryEntry &b) {
    if (a.ready_at != b.ready_at) {
        return a.ready_at > b.ready_at;
    }
    return a.sequence > b.sequence;
}

}  // namespace

RetryScheduler::RetryScheduler(std::shared_ptr<queue::PriorityQueue> queue, std::shared_ptr<TaskTracker> tracker)
    : queue_(std::move(queue)), tracker_(std::move(tracker)) {
    if (!queue_) {
        throw std::invalid_argument("PriorityQueue cannot be null");
    }
    if (!tracker_) {
        throw std::invalid_argument("TaskTracker cannot be null");
    }
}

void RetryScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (release_thread_.joinable()) {
        throw std::logic_error("RetryScheduler already started");
    }
    stopping_ = false;
    release_thread_ = std::thread(&RetryScheduler::ReleaseLoop, this);
}

void RetryScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (release_thread_.joinable()) {
        release_thread_.join();
    }
}

void RetryScheduler::PushLocked(RetryEntry entry) {
    heap_.push_back(std::move(entry));
    std::push_heap(heap_.begin(), heap_.end(), LaterThan);
}

void RetryScheduler::schedule(Task task, std::chrono::steady_clock::time_point ready_at, TaskState parked_state) {
    if (parked_state != TaskState::Retrying && parked_state != TaskState::Scheduled) {
        throw std::invalid_argument("Parked state must be Retrying or Scheduled");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RetryEntry entry{std::move(task), ready_at, parked_state, next_sequence_++};
        PushLocked(std::move(entry));
    }
    // Поток возврата пересчитает ближайший срок, если новая запись раньше текущей
    cv_.notify_all();
}

bool RetryScheduler::Release(RetryEntry &entry) {
    const std::string task_id = entry.task.id;

    // Состояние меняется до push: рабочий поток может забрать задачу сразу
    tracker_->transition(task_id, entry.parked_state, TaskState::Pending);
    if (queue_->push(std::move(entry.task)) == EnqueueStatus::Ok) {
        spdlog::debug("[RetryScheduler] Released task {} back to the queue", task_id);
        return true;
    }

    tracker_->transition(task_id, TaskState::Pending, entry.parked_state);
    return false;
}

void RetryScheduler::ReleaseLoop() {
    try {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            if (heap_.empty()) {
                cv_.wait(lock, [this] { return stopping_ || !heap_.empty(); });
                continue;
            }

            const auto next_ready = heap_.front().ready_at;
            if (std::chrono::steady_clock::now() < next_ready) {
                // Спим до ближайшего срока; schedule() будит раньше
                cv_.wait_until(lock, next_ready);
                continue;
            }

            std::pop_heap(heap_.begin(), heap_.end(), LaterThan);
            RetryEntry entry = std::move(heap_.back());
            heap_.pop_back();
            ++releasing_;

            lock.unlock();
            const bool released = Release(entry);
            lock.lock();
            --releasing_;

            if (!released) {
                // Очередь остановлена: запись возвращается в кучу до drain()
                PushLocked(std::move(entry));
                spdlog::info("[RetryScheduler] Queue is shut down, {} entries left in place", heap_.size());
                cv_.wait(lock, [this] { return stopping_; });
            }
        }
    } catch (const InvariantViolation &e) {
        spdlog::critical("[RetryScheduler] Invariant violation: {}", e.what());
        std::abort();
    }
}

std::optional<RetryEntry> RetryScheduler::cancel(const std::string &task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(heap_.begin(), heap_.end(),
                           [&task_id](const RetryEntry &entry) { return entry.task.id == task_id; });
    if (it == heap_.end()) {
        return std::nullopt;
    }
    RetryEntry entry = std::move(*it);
    heap_.erase(it);
    std::make_heap(heap_.begin(), heap_.end(), LaterThan);
    return entry;
}

std::vector<RetryEntry> RetryScheduler::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RetryEntry> entries;
    entries.swap(heap_);
    std::sort(entries.begin(), entries.end(),
              [](const RetryEntry &a, const RetryEntry &b) { return LaterThan(b, a); });
    return entries;
}

size_t RetryScheduler::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heap_.size() + releasing_;
}

std::optional<std::chrono::steady_clock::time_point> RetryScheduler::next_ready_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (heap_.empty()) {
        return std::nullopt;
    }
    return heap_.front().ready_at;
}

RetryScheduler::~RetryScheduler() {
    bool blocked_in_push = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked_in_push = releasing_ > 0;
    }
    // Возврат может ждать места в заполненной полосе
    if (blocked_in_push) {
        queue_->shutdown();
    }
    stop();
}

}  // namespace jobqueue::retry
