#include "job_queue.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace jobqueue {

JobQueue::JobQueue(JobQueueConfig config) : config_(std::move(config)) {
    if (config_.worker_count == 0) {
        throw std::invalid_argument("Number of threads must be positive");
    }
    if (config_.default_max_retries < 0) {
        throw std::invalid_argument("default_max_retries must be non-negative");
    }
    if (config_.idle_wait.count() <= 0) {
        throw std::invalid_argument("idle_wait must be positive");
    }
    if (config_.retry.base_delay.count() < 0 || config_.retry.max_delay < config_.retry.base_delay) {
        throw std::invalid_argument("Retry delays must satisfy 0 <= base_delay <= max_delay");
    }
    if (config_.finished_retention.count() < 0) {
        throw std::invalid_argument("finished_retention must be non-negative");
    }

    // Если конфигурация полос не указана, используется конфигурация по умолчанию
    if (config_.lanes.empty()) {
        config_.lanes = GetDefaultQueueConfig();
    }

    priority_queue_ = std::make_shared<queue::PriorityQueue>(config_.lanes);
    tracker_ = std::make_shared<TaskTracker>(config_.finished_retention);
    scheduler_ = std::make_shared<retry::RetryScheduler>(priority_queue_, tracker_);
    dead_letters_ = std::make_shared<dead_letter::DeadLetterSink>();
    handlers_ = std::make_shared<HandlerRegistry>();
    counters_ = std::make_shared<QueueCounters>();
}

void JobQueue::register_handler(const std::string &task_type, TaskHandler handler) {
    handlers_->register_handler(task_type, std::move(handler));
    spdlog::debug("[JobQueue] Registered handler for '{}'", task_type);
}

void JobQueue::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_) {
        throw QueueShutdownError("JobQueue has been shut down");
    }
    if (started_) {
        throw std::logic_error("JobQueue already started");
    }

    thread_pool::WorkerContext context;
    context.queue = priority_queue_;
    context.scheduler = scheduler_;
    context.dead_letters = dead_letters_;
    context.handlers = handlers_;
    context.tracker = tracker_;
    context.counters = counters_;
    context.retry_policy = config_.retry;
    context.handler_timeout = config_.handler_timeout;
    context.idle_wait = config_.idle_wait;

    thread_pool_ = std::make_unique<thread_pool::ThreadPool>(std::move(context), config_.worker_count);
    scheduler_->start();
    started_ = true;
    started_at_ = std::chrono::steady_clock::now();

    spdlog::info("[JobQueue] Started {} workers ({} handlers, retry strategy {}, base {}ms, max {}ms)",
                 config_.worker_count, handlers_->size(), retry::ToString(config_.retry.strategy),
                 config_.retry.base_delay.count(), config_.retry.max_delay.count());
}

bool JobQueue::is_running() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return started_ && !shut_down_;
}

int JobQueue::ResolveMaxRetries(std::optional<int> max_retries) const {
    return max_retries.value_or(config_.default_max_retries);
}

void JobQueue::CheckLane(TaskPriority priority) const {
    if (!priority_queue_->has_lane(priority)) {
        throw std::invalid_argument("Queue for given priority does not exist.");
    }
}

std::optional<std::string> JobQueue::Submit(Task task) {
    CheckLane(task.priority);
    const std::string task_id = task.id;
    const TaskPriority priority = task.priority;

    // Регистрируем до push: рабочий поток может забрать задачу сразу
    tracker_->track(task_id, TaskState::Pending);
    if (priority_queue_->push(std::move(task)) != EnqueueStatus::Ok) {
        tracker_->forget(task_id);
        return std::nullopt;
    }

    counters_->total_enqueued.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("[JobQueue] Enqueued task {} ({})", task_id, ToString(priority));
    return task_id;
}

std::string JobQueue::enqueue(const std::string &task_type, Payload payload, TaskPriority priority,
                              std::optional<int> max_retries) {
    auto task_id = try_enqueue(task_type, std::move(payload), priority, max_retries);
    if (!task_id.has_value()) {
        throw QueueShutdownError("JobQueue is shut down, task of type '" + task_type + "' rejected");
    }
    return *task_id;
}

std::string JobQueue::enqueue(const std::string &task_type, Payload payload, const TaskAttributes &attributes,
                              std::optional<int> max_retries) {
    if (!config_.classifier) {
        throw std::invalid_argument("No priority classifier configured");
    }
    return enqueue(task_type, std::move(payload), config_.classifier(attributes), max_retries);
}

std::optional<std::string> JobQueue::try_enqueue(const std::string &task_type, Payload payload,
                                                 TaskPriority priority, std::optional<int> max_retries) {
    return Submit(MakeTask(task_type, std::move(payload), priority, ResolveMaxRetries(max_retries)));
}

std::vector<std::string> JobQueue::enqueue_batch(std::vector<TaskSpec> specs) {
    std::vector<Task> tasks;
    tasks.reserve(specs.size());
    for (auto &spec : specs) {
        CheckLane(spec.priority);
        tasks.push_back(MakeTask(std::move(spec.task_type), std::move(spec.payload), spec.priority,
                                 ResolveMaxRetries(spec.max_retries)));
    }

    std::vector<std::string> task_ids;
    task_ids.reserve(tasks.size());
    for (auto &task : tasks) {
        auto task_id = Submit(std::move(task));
        if (!task_id.has_value()) {
            throw QueueShutdownError("JobQueue is shut down, batch rejected after " + std::to_string(task_ids.size()) +
                                     " of " + std::to_string(tasks.size()) + " task(s)");
        }
        task_ids.push_back(std::move(*task_id));
    }

    spdlog::debug("[JobQueue] Enqueued batch of {} task(s)", task_ids.size());
    return task_ids;
}

std::string JobQueue::enqueue_delayed(const std::string &task_type, Payload payload, TaskPriority priority,
                                      std::chrono::milliseconds delay, std::optional<int> max_retries) {
    if (delay.count() < 0) {
        throw std::invalid_argument("Delay must be non-negative");
    }
    CheckLane(priority);
    if (priority_queue_->is_shutdown()) {
        throw QueueShutdownError("JobQueue is shut down, task of type '" + task_type + "' rejected");
    }

    Task task = MakeTask(task_type, std::move(payload), priority, ResolveMaxRetries(max_retries));
    const std::string task_id = task.id;

    tracker_->track(task_id, TaskState::Scheduled);
    scheduler_->schedule(std::move(task), std::chrono::steady_clock::now() + delay, TaskState::Scheduled);
    counters_->total_enqueued.fetch_add(1, std::memory_order_relaxed);

    spdlog::debug("[JobQueue] Scheduled task {} ({}) in {}ms", task_id, ToString(priority), delay.count());
    return task_id;
}

bool JobQueue::cancel(const std::string &task_id) {
    if (auto task = priority_queue_->extract(task_id)) {
        tracker_->transition(task_id, TaskState::Pending, TaskState::Cancelled);
        spdlog::info("[JobQueue] Cancelled pending task {}", task_id);
        return true;
    }

    if (auto entry = scheduler_->cancel(task_id)) {
        tracker_->transition(task_id, entry->parked_state, TaskState::Cancelled);
        spdlog::info("[JobQueue] Cancelled {} task {}", ToString(entry->parked_state), task_id);
        return true;
    }

    return false;
}

std::optional<TaskState> JobQueue::get_task_state(const std::string &task_id) const { return tracker_->state(task_id); }

std::optional<TaskState> JobQueue::wait_for(const std::string &task_id, std::chrono::milliseconds timeout) const {
    return tracker_->wait_finished(task_id, timeout);
}

std::vector<std::string> JobQueue::tasks_in_state(TaskState state) const { return tracker_->ids_in_state(state); }

size_t JobQueue::cleanup_finished(std::chrono::steady_clock::duration older_than) {
    return tracker_->cleanup_finished(older_than);
}

QueueStats JobQueue::get_stats() const {
    QueueStats stats;
    stats.lane_sizes = priority_queue_->lane_sizes();
    stats.retry_pending = scheduler_->size();
    stats.dead_letter_count = dead_letters_->size();
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        stats.running = thread_pool_ ? thread_pool_->running() : 0;
    }
    stats.total_enqueued = counters_->total_enqueued.load(std::memory_order_relaxed);
    stats.processed = counters_->processed.load(std::memory_order_relaxed);
    stats.failed = counters_->failed.load(std::memory_order_relaxed);
    stats.retried = counters_->retried.load(std::memory_order_relaxed);
    stats.dead_lettered = counters_->dead_lettered.load(std::memory_order_relaxed);
    return stats;
}

std::vector<WorkerStats> JobQueue::get_worker_stats() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!thread_pool_) {
        return {};
    }
    return thread_pool_->stats();
}

HealthReport JobQueue::health_check() const {
    HealthReport report;
    report.worker_count = config_.worker_count;
    report.queue_size = priority_queue_->size();
    report.retry_pending = scheduler_->size();
    report.dead_letter_count = dead_letters_->size();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (thread_pool_) {
        report.live_workers = thread_pool_->live_workers();
        report.busy_workers = thread_pool_->running();
    }
    if (started_) {
        report.uptime =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at_);
    }

    if (!started_ || shut_down_ || report.live_workers == 0) {
        report.status = HealthStatus::Unhealthy;
    } else if (report.live_workers < report.worker_count ||
               (report.busy_workers >= report.live_workers && report.queue_size > 0)) {
        report.status = HealthStatus::Degraded;
    } else {
        report.status = HealthStatus::Healthy;
    }
    return report;
}

std::vector<dead_letter::DeadLetterRecord> JobQueue::list_dead_letters() const { return dead_letters_->list(); }

std::vector<dead_letter::DeadLetterRecord> JobQueue::drain_dead_letters() { return dead_letters_->drain(); }

std::optional<std::string> JobQueue::resubmit_dead_letter(const std::string &task_id) {
    if (priority_queue_->is_shutdown()) {
        throw QueueShutdownError("JobQueue is shut down, dead letter " + task_id + " not resubmitted");
    }

    auto record = dead_letters_->take(task_id);
    if (!record.has_value()) {
        return std::nullopt;
    }

    const Task &original = record->task;
    auto new_id = Submit(MakeTask(original.task_type, original.payload, original.priority, original.max_retries));
    if (!new_id.has_value()) {
        // Остановка произошла между проверкой и push: запись возвращается на место
        dead_letters_->restore(std::move(*record));
        throw QueueShutdownError("JobQueue is shut down, dead letter " + task_id + " not resubmitted");
    }

    spdlog::info("[JobQueue] Resubmitted dead letter {} as task {}", task_id, *new_id);
    return new_id;
}

size_t JobQueue::RemainingLocked() const {
    const size_t running = thread_pool_ ? thread_pool_->running() : 0;
    return priority_queue_->size() + scheduler_->size() + running;
}

size_t JobQueue::shutdown(std::chrono::milliseconds timeout) {
    thread_pool::ThreadPool *pool = nullptr;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (shut_down_) {
            return RemainingLocked();
        }
        shut_down_ = true;
        // После shut_down_ пул больше не пересоздаётся: указатель остаётся действительным без блокировки,
        // а обработчики могут читать статистику, пока мы ждём их завершения
        pool = thread_pool_.get();
    }

    spdlog::info("[JobQueue] Shutting down (timeout {}ms)", timeout.count());

    // Порядок важен: сначала рабочие потоки перестают брать задачи, затем очередь
    // будит заблокированных продюсеров и поток возврата, после чего его можно остановить
    if (pool) {
        pool->request_stop();
    }
    priority_queue_->shutdown();
    scheduler_->stop();

    bool all_joined = true;
    if (pool) {
        all_joined = pool->join(timeout);
    }

    const size_t queued = priority_queue_->size();
    const size_t retry_pending = scheduler_->size();
    const size_t running = pool ? pool->running() : 0;
    const size_t remaining = queued + retry_pending + running;
    if (!all_joined) {
        spdlog::warn("[JobQueue] Shutdown timeout reached with {} task(s) still running", running);
    }
    spdlog::info("[JobQueue] Stopped: {} task(s) left unprocessed (queued={}, retry_pending={})", remaining, queued,
                 retry_pending);
    return remaining;
}

std::vector<Task> JobQueue::take_remaining() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!shut_down_) {
        throw std::logic_error("take_remaining() requires shutdown() first");
    }

    std::vector<Task> tasks = priority_queue_->drain();
    for (auto &entry : scheduler_->drain()) {
        tasks.push_back(std::move(entry.task));
    }
    for (const auto &task : tasks) {
        tracker_->forget(task.id);
    }
    return tasks;
}

JobQueue::~JobQueue() {
    bool needs_shutdown = false;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        needs_shutdown = !shut_down_;
    }
    if (needs_shutdown) {
        shutdown(config_.shutdown_timeout);
    }
}

}  // namespace jobqueue
