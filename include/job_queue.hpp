#pragma once

#include "classifier.hpp"
#include "config.hpp"
#include "dead_letter/dead_letter_sink.hpp"
#include "errors.hpp"
#include "handler_registry.hpp"
#include "queue/priority_queue.hpp"
#include "retry/retry_scheduler.hpp"
#include "stats.hpp"
#include "task.hpp"
#include "task_tracker.hpp"
#include "thread_pool/thread_pool.hpp"
#include "types.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace jobqueue {

// Одна задача пакета для enqueue_batch()
struct TaskSpec {
    std::string task_type;
    Payload payload;
    TaskPriority priority = TaskPriority::Medium;
    std::optional<int> max_retries;
};

// Контроллер очереди задач.
// Владеет полосами приоритетов, планировщиком повторов, dead-letter хранилищем и пулом потоков.
// Каждый экземпляр независим: в одном процессе может работать несколько очередей.
//
// Путь задачи: enqueue -> полоса -> рабочий поток -> (сбой -> планировщик -> полоса)* -> успех или dead-letter.
class JobQueue {
private:
    JobQueueConfig config_;
    std::shared_ptr<queue::PriorityQueue> priority_queue_;  // Общая очередь задач для пула потоков
    std::shared_ptr<retry::RetryScheduler> scheduler_;
    std::shared_ptr<dead_letter::DeadLetterSink> dead_letters_;
    std::shared_ptr<HandlerRegistry> handlers_;
    std::shared_ptr<TaskTracker> tracker_;
    std::shared_ptr<QueueCounters> counters_;
    std::unique_ptr<thread_pool::ThreadPool> thread_pool_;  // Создаётся в start()

    mutable std::mutex lifecycle_mutex_;  // Защищает started_, started_at_, shut_down_ и thread_pool_
    bool started_ = false;
    bool shut_down_ = false;
    std::chrono::steady_clock::time_point started_at_;

    int ResolveMaxRetries(std::optional<int> max_retries) const;
    void CheckLane(TaskPriority priority) const;
    std::optional<std::string> Submit(Task task);
    size_t RemainingLocked() const;

public:
    explicit JobQueue(JobQueueConfig config = {});

    JobQueue(const JobQueue &) = delete;
    JobQueue &operator=(const JobQueue &) = delete;

    void register_handler(const std::string &task_type, TaskHandler handler);

    // Запускает рабочие потоки и поток возврата повторов
    void start();

    bool is_running() const;

    // Может блокироваться при заполненной полосе. Бросает QueueShutdownError после shutdown().
    std::string enqueue(const std::string &task_type, Payload payload, TaskPriority priority,
                        std::optional<int> max_retries = std::nullopt);

    // Приоритет выбирает config.classifier
    std::string enqueue(const std::string &task_type, Payload payload, const TaskAttributes &attributes,
                        std::optional<int> max_retries = std::nullopt);

    // Как enqueue, но после shutdown возвращает std::nullopt вместо исключения
    std::optional<std::string> try_enqueue(const std::string &task_type, Payload payload, TaskPriority priority,
                                           std::optional<int> max_retries = std::nullopt);

    // Все задачи проверяются до постановки первой: неверная спецификация не оставляет половину пакета.
    // Возвращает id в порядке спецификаций.
    std::vector<std::string> enqueue_batch(std::vector<TaskSpec> specs);

    // Задача попадёт в полосу не раньше чем через delay
    std::string enqueue_delayed(const std::string &task_type, Payload payload, TaskPriority priority,
                                std::chrono::milliseconds delay, std::optional<int> max_retries = std::nullopt);

    // Снимает ожидающую задачу (в полосе или в планировщике). Выполняющуюся или завершённую - нет.
    bool cancel(const std::string &task_id);

    std::optional<TaskState> get_task_state(const std::string &task_id) const;

    // Ждёт завершения задачи (Completed, DeadLettered или Cancelled) не дольше timeout.
    // Возвращает состояние на момент выхода; std::nullopt для неизвестного id.
    std::optional<TaskState> wait_for(const std::string &task_id, std::chrono::milliseconds timeout) const;

    std::vector<std::string> tasks_in_state(TaskState state) const;

    size_t cleanup_finished(std::chrono::steady_clock::duration older_than);

    QueueStats get_stats() const;

    std::vector<WorkerStats> get_worker_stats() const;

    HealthReport health_check() const;

    std::vector<dead_letter::DeadLetterRecord> list_dead_letters() const;

    std::vector<dead_letter::DeadLetterRecord> drain_dead_letters();

    // Новая задача с теми же данными и retry_count = 0. std::nullopt, если записи нет.
    std::optional<std::string> resubmit_dead_letter(const std::string &task_id);

    // Кооперативная остановка: потоки дорабатывают текущие задачи.
    // Возвращает число задач, оставшихся необработанными (в полосах, в планировщике, в работе).
    size_t shutdown(std::chrono::milliseconds timeout);

    // После shutdown(): забирает оставшиеся задачи, чтобы вызывающий мог их сохранить
    std::vector<Task> take_remaining();

    ~JobQueue();
};

}  // namespace jobqueue
