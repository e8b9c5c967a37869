#pragma once

#include "classifier.hpp"
#include "retry/retry_policy.hpp"
#include "task.hpp"
#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>

namespace jobqueue {

bool get_env_bool(const char *name, bool default_value);
int get_env_int(const char *name, int default_value);
std::string get_env_string(const char *name, const std::string &default_value);

// Все полосы без ограничения ёмкости
std::unordered_map<TaskPriority, queue::QueueOptions> GetDefaultQueueConfig();

// capacity <= 0 - неограниченная полоса
queue::QueueOptions LaneOptions(int capacity);

struct JobQueueConfig {
    size_t worker_count = 4;
    std::unordered_map<TaskPriority, queue::QueueOptions> lanes = GetDefaultQueueConfig();
    retry::RetryPolicy retry;
    int default_max_retries = kDefaultMaxRetries;
    std::chrono::milliseconds handler_timeout{30000};  // 0 - без ограничения, обработчик вызывается в рабочем потоке
    std::chrono::milliseconds idle_wait{100};
    std::chrono::milliseconds shutdown_timeout{30000};  // Для деструктора
    std::chrono::milliseconds finished_retention{300000};  // Сколько помнить завершённые задачи; 0 - до cleanup_finished()
    PriorityClassifier classifier;                      // Необязателен

    static JobQueueConfig from_env();
};

}  // namespace jobqueue
