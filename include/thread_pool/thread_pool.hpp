#pragma once

#include "dead_letter/dead_letter_sink.hpp"
#include "handler_registry.hpp"
#include "queue/priority_queue.hpp"
#include "retry/retry_policy.hpp"
#include "retry/retry_scheduler.hpp"
#include "stats.hpp"
#include "task_tracker.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace jobqueue::thread_pool {

// Всё, с чем работают рабочие потоки. Владение разделяется с контроллером.
struct WorkerContext {
    std::shared_ptr<queue::PriorityQueue> queue;
    std::shared_ptr<retry::RetryScheduler> scheduler;
    std::shared_ptr<dead_letter::DeadLetterSink> dead_letters;
    std::shared_ptr<HandlerRegistry> handlers;
    std::shared_ptr<TaskTracker> tracker;
    std::shared_ptr<QueueCounters> counters;
    retry::RetryPolicy retry_policy;
    std::chrono::milliseconds handler_timeout{0};  // 0 - без ограничения
    std::chrono::milliseconds idle_wait{100};
};

class ThreadPool {
private:
    // Поток, отсоединённый по таймауту остановки, продолжает владеть этим состоянием
    struct PoolState {
        explicit PoolState(WorkerContext ctx) : context(std::move(ctx)) {}

        const WorkerContext context;
        std::atomic<bool> stopping{false};
        mutable std::mutex mutex;  // Защищает workers, exited и live_workers
        std::condition_variable cv_worker_exited;
        std::vector<WorkerStats> workers;
        std::vector<bool> exited;
        size_t live_workers = 0;
    };

    static void WorkerLoop(std::shared_ptr<PoolState> state, size_t index);
    static void ProcessTask(PoolState &state, size_t index, Task task);
    static void HandleFailure(const WorkerContext &context, size_t index, Task task, const TaskResult &result);
    static TaskResult Execute(const WorkerContext &context, const Task &task);
    static TaskResult Invoke(const TaskHandler &handler, const Payload &payload);

    std::shared_ptr<PoolState> state_;
    std::vector<std::thread> worker_threads_;  // Вектор рабочих потоков
    const size_t num_threads_;

public:
    ThreadPool(WorkerContext context, size_t num_threads);

    // Потоки дорабатывают текущую задачу и выходят; новые задачи не берутся
    void request_stop();

    // Ждёт завершения потоков не дольше timeout. Не успевшие потоки отсоединяются,
    // их задачи не прерываются. Возвращает true, если завершились все.
    bool join(std::chrono::milliseconds timeout);

    std::vector<WorkerStats> stats() const;

    // Число задач, выполняемых прямо сейчас
    size_t running() const;

    // Потоки, ещё не вышедшие из цикла
    size_t live_workers() const;

    size_t size() const { return num_threads_; }

    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;
};

}  // namespace jobqueue::thread_pool
