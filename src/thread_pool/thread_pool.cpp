#include "thread_pool/thread_pool.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <exception>
#include <future>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace jobqueue::thread_pool {

ThreadPool::ThreadPool(WorkerContext context, size_t num_threads) : num_threads_(num_threads) {
    if (!context.queue || !context.scheduler || !context.dead_letters || !context.handlers || !context.tracker ||
        !context.counters) {
        throw std::invalid_argument("WorkerContext must be fully initialized");
    }

    if (num_threads_ == 0) {
        throw std::invalid_argument("Number of threads must be positive");
    }

    state_ = std::make_shared<PoolState>(std::move(context));
    state_->workers.resize(num_threads_);
    state_->exited.assign(num_threads_, false);
    state_->live_workers = num_threads_;
    for (size_t i = 0; i < num_threads_; ++i) {
        state_->workers[i].worker_id = i;
    }

    worker_threads_.reserve(num_threads_);
    for (size_t i = 0; i < num_threads_; ++i) {
        worker_threads_.emplace_back(&ThreadPool::WorkerLoop, state_, i);
    }
}

// Цикл каждого рабочего потока
void ThreadPool::WorkerLoop(std::shared_ptr<PoolState> state, size_t index) {
    const WorkerContext &ctx = state->context;
    spdlog::debug("[Worker {}] Started", index);

    try {
        while (!state->stopping.load(std::memory_order_acquire)) {
            // Ожидание ограничено idle_wait, push будит сразу
            auto task_opt = ctx.queue->pop_for(ctx.idle_wait);

            // Простаивающие потоки тоже просыпаются раз в idle_wait, так что старые записи не копятся
            ctx.tracker->prune_expired();

            if (!task_opt.has_value()) {
                // Пусто - это не ошибка; после shutdown пустой очереди работы больше не будет
                if (ctx.queue->is_shutdown()) {
                    break;
                }
                continue;
            }

            ProcessTask(*state, index, std::move(task_opt.value()));
        }
    } catch (const InvariantViolation &e) {
        spdlog::critical("[Worker {}] Invariant violation: {}", index, e.what());
        std::abort();
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->exited[index] = true;
        --state->live_workers;
    }
    state->cv_worker_exited.notify_all();
    spdlog::debug("[Worker {}] Stopped", index);
}

void ThreadPool::ProcessTask(PoolState &state, size_t index, Task task) {
    const WorkerContext &ctx = state.context;
    const std::string task_id = task.id;

    ctx.tracker->transition(task_id, TaskState::Pending, TaskState::Running);
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.workers[index].busy = true;
        state.workers[index].current_task_id = task_id;
    }

    spdlog::debug("[Worker {}] Running task {} (type={}, priority={}, attempt {})", index, task_id, task.task_type,
                  ToString(task.priority), task.retry_count + 1);

    TaskResult result = TaskResult::Ok();
    try {
        result = Execute(ctx, task);
    } catch (const InvariantViolation &) {
        throw;
    } catch (const std::exception &e) {
        // Обработчик не был запущен (например, не удалось создать поток): задача не должна застрять в Running
        spdlog::warn("[Worker {}] Could not run task {}: {}", index, task_id, e.what());
        result = TaskResult::Retry(std::string("failed to run handler: ") + e.what());
    }
    const bool succeeded = result.ok();

    if (succeeded) {
        ctx.tracker->transition(task_id, TaskState::Running, TaskState::Completed);
        ctx.counters->processed.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[Worker {}] Task {} completed", index, task_id);
    } else {
        HandleFailure(ctx, index, std::move(task), result);
    }

    std::lock_guard<std::mutex> lock(state.mutex);
    WorkerStats &stats = state.workers[index];
    stats.busy = false;
    stats.current_task_id.clear();
    if (succeeded) {
        ++stats.processed;
    } else {
        ++stats.failed;
    }
}

void ThreadPool::HandleFailure(const WorkerContext &context, size_t index, Task task, const TaskResult &result) {
    context.counters->failed.fetch_add(1, std::memory_order_relaxed);

    const std::string task_id = task.id;
    const auto decision = retry::DecideOnFailure(context.retry_policy, task, result);

    if (decision.action == retry::RetryAction::Retry) {
        spdlog::warn("[Worker {}] Task {} failed (retry {}/{}): {}; next attempt in {}ms", index, task_id,
                     task.retry_count, task.max_retries, result.reason(), decision.delay.count());

        // Сначала состояние: задача может вернуться в очередь сразу после schedule()
        context.tracker->transition(task_id, TaskState::Running, TaskState::Retrying);
        context.counters->retried.fetch_add(1, std::memory_order_relaxed);
        context.scheduler->schedule(std::move(task), std::chrono::steady_clock::now() + decision.delay,
                                    TaskState::Retrying);
        return;
    }

    context.tracker->transition(task_id, TaskState::Running, TaskState::DeadLettered);
    context.dead_letters->add(std::move(task), decision.reason);
    context.counters->dead_lettered.fetch_add(1, std::memory_order_relaxed);
}

TaskResult ThreadPool::Invoke(const TaskHandler &handler, const Payload &payload) {
    // Исключения обработчика не покидают рабочий поток
    try {
        return handler(payload);
    } catch (const std::exception &e) {
        return TaskResult::Retry(std::string("handler threw: ") + e.what());
    } catch (...) {
        return TaskResult::Retry("handler threw a non-standard exception");
    }
}

TaskResult ThreadPool::Execute(const WorkerContext &context, const Task &task) {
    auto handler_opt = context.handlers->find(task.task_type);
    if (!handler_opt.has_value()) {
        return TaskResult::Retry("no handler registered for task type '" + task.task_type + "'");
    }

    if (context.handler_timeout.count() <= 0) {
        return Invoke(*handler_opt, task.payload);
    }

    // Отдельный поток владеет своей копией обработчика и payload: после таймаута он может пережить задачу
    auto promise = std::make_shared<std::promise<TaskResult>>();
    auto future = promise->get_future();

    std::thread runner([promise, handler = std::move(*handler_opt), payload = task.payload]() {
        promise->set_value(Invoke(handler, payload));
    });

    if (future.wait_for(context.handler_timeout) == std::future_status::timeout) {
        // Прервать обработчик нельзя: поток завершится сам, результат будет отброшен
        runner.detach();
        spdlog::warn("[Worker] Task {} handler exceeded {}ms", task.id, context.handler_timeout.count());
        return TaskResult::Retry("handler timed out after " + std::to_string(context.handler_timeout.count()) + "ms");
    }

    runner.join();
    return future.get();
}

void ThreadPool::request_stop() { state_->stopping.store(true, std::memory_order_release); }

bool ThreadPool::join(std::chrono::milliseconds timeout) {
    request_stop();

    std::vector<bool> exited;
    bool all_exited = false;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        all_exited = state_->cv_worker_exited.wait_for(lock, timeout, [this] { return state_->live_workers == 0; });
        exited = state_->exited;
    }

    for (size_t i = 0; i < worker_threads_.size(); ++i) {
        if (!worker_threads_[i].joinable()) {
            continue;
        }
        if (exited[i]) {
            worker_threads_[i].join();
        } else {
            spdlog::warn("[Worker {}] Still busy after {}ms shutdown timeout, detaching", i, timeout.count());
            worker_threads_[i].detach();
        }
    }
    return all_exited;
}

std::vector<WorkerStats> ThreadPool::stats() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->workers;
}

size_t ThreadPool::live_workers() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->live_workers;
}

size_t ThreadPool::running() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    size_t busy = 0;
    for (const auto &worker : state_->workers) {
        if (worker.busy) {
            ++busy;
        }
    }
    return busy;
}

ThreadPool::~ThreadPool() {
    request_stop();

    // Ждём завершения всех рабочих потоков
    for (auto &thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

}  // namespace jobqueue::thread_pool
