#pragma once

#include "queue/priority_queue.hpp"
#include "task.hpp"
#include "task_tracker.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace jobqueue::retry {

struct RetryEntry {
    Task task;
    std::chrono::steady_clock::time_point ready_at;
    TaskState parked_state = TaskState::Retrying;  // Retrying (после сбоя) или Scheduled (отложенная постановка)
    uint64_t sequence = 0;                         // При равном ready_at сохраняет порядок вставки
};

// Держит задачи до наступления ready_at и возвращает их в очередь приоритетов.
// Единственный путь повторного попадания задачи в полосы после сбоя.
class RetryScheduler {
private:
    std::shared_ptr<queue::PriorityQueue> queue_;
    std::shared_ptr<TaskTracker> tracker_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;    // Новая запись или остановка
    std::vector<RetryEntry> heap_;  // Min-куча по ready_at
    uint64_t next_sequence_ = 0;
    size_t releasing_ = 0;  // Извлечены из кучи, но ещё не приняты очередью
    bool stopping_ = false;
    std::thread release_thread_;

    void ReleaseLoop();
    bool Release(RetryEntry &entry);
    void PushLocked(RetryEntry entry);

public:
    RetryScheduler(std::shared_ptr<queue::PriorityQueue> queue, std::shared_ptr<TaskTracker> tracker);

    RetryScheduler(const RetryScheduler &) = delete;
    RetryScheduler &operator=(const RetryScheduler &) = delete;

    // Запускает поток возврата задач
    void start();

    // Останавливает поток; записи в куче остаются на месте.
    // Очередь приоритетов должна быть остановлена раньше, иначе возврат может ждать места в полосе.
    void stop();

    void schedule(Task task, std::chrono::steady_clock::time_point ready_at, TaskState parked_state);

    std::optional<RetryEntry> cancel(const std::string &task_id);

    std::vector<RetryEntry> drain();

    size_t size() const;

    std::optional<std::chrono::steady_clock::time_point> next_ready_at() const;

    ~RetryScheduler();
};

}  // namespace jobqueue::retry
