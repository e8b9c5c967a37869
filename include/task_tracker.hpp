#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jobqueue {

// Где находится задача: Pending - в полосе, Running - у рабочего потока,
// Scheduled/Retrying - в куче планировщика, остальные - конечные состояния.
enum class TaskState { Pending, Scheduled, Running, Retrying, Completed, DeadLettered, Cancelled };

const char *ToString(TaskState state);

bool IsFinished(TaskState state);

// Реестр состояний задач. Каждая передача задачи между компонентами проходит через transition();
// переход из состояния, в котором задачи нет, означает что задача оказалась в двух местах.
class TaskTracker {
private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        TaskState state;
        Clock::time_point updated_at;
    };

    const Clock::duration retention_;  // 0 - завершённые записи хранятся до cleanup_finished()
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_finished_;
    std::unordered_map<std::string, Entry> entries_;
    std::deque<std::pair<std::string, Clock::time_point>> finished_order_;  // В порядке завершения

    void RecordLocked(const std::string &task_id, Entry &entry, TaskState state);

public:
    explicit TaskTracker(Clock::duration retention = Clock::duration::zero());

    // Бросает InvariantViolation, если id уже известен
    void track(const std::string &task_id, TaskState initial);

    // Бросает InvariantViolation, если задача неизвестна или находится не в состоянии from
    void transition(const std::string &task_id, TaskState from, TaskState to);

    void forget(const std::string &task_id);

    std::optional<TaskState> state(const std::string &task_id) const;

    // Ждёт конечного состояния не дольше timeout. Возвращает состояние на момент выхода;
    // std::nullopt, если задача неизвестна.
    std::optional<TaskState> wait_finished(const std::string &task_id, std::chrono::milliseconds timeout) const;

    size_t count(TaskState state) const;

    std::vector<std::string> ids_in_state(TaskState state) const;

    // Удаляет завершённые записи старше older_than, возвращает их число
    size_t cleanup_finished(Clock::duration older_than);

    // Удаляет завершённые записи старше retention. Без retention ничего не делает.
    size_t prune_expired();
};

}  // namespace jobqueue
