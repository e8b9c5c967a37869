#include "config.hpp"
#include <cstdlib>
#include <cstring>

namespace jobqueue {

bool get_env_bool(const char *name, bool default_value) {
    const char *value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0 || std::strcmp(value, "1") == 0;
}

int get_env_int(const char *name, int default_value) {
    const char *value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

std::string get_env_string(const char *name, const std::string &default_value) {
    const char *value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

std::unordered_map<TaskPriority, queue::QueueOptions> GetDefaultQueueConfig() {
    return {
        {TaskPriority::High, {false}},
        {TaskPriority::Medium, {false}},
        {TaskPriority::Low, {false}},
    };
}

queue::QueueOptions LaneOptions(int capacity) {
    if (capacity > 0) {
        return {true, capacity};
    }
    return {false};
}

JobQueueConfig JobQueueConfig::from_env() {
    JobQueueConfig config;
    const int workers = get_env_int("JOBQUEUE_WORKERS", 4);
    config.worker_count = workers > 0 ? static_cast<size_t>(workers) : 0;

    config.lanes = {
        {TaskPriority::High, LaneOptions(get_env_int("JOBQUEUE_HIGH_CAPACITY", 0))},
        {TaskPriority::Medium, LaneOptions(get_env_int("JOBQUEUE_MEDIUM_CAPACITY", 0))},
        {TaskPriority::Low, LaneOptions(get_env_int("JOBQUEUE_LOW_CAPACITY", 0))},
    };

    config.retry.strategy = retry::ParseRetryStrategy(get_env_string("JOBQUEUE_RETRY_STRATEGY", "exponential"));
    config.retry.base_delay = std::chrono::milliseconds(get_env_int("JOBQUEUE_RETRY_BASE_MS", 1000));
    config.retry.max_delay = std::chrono::milliseconds(get_env_int("JOBQUEUE_RETRY_MAX_MS", 300000));
    config.retry.jitter = get_env_bool("JOBQUEUE_RETRY_JITTER", false);

    config.default_max_retries = get_env_int("JOBQUEUE_DEFAULT_MAX_RETRIES", kDefaultMaxRetries);
    config.handler_timeout = std::chrono::milliseconds(get_env_int("JOBQUEUE_HANDLER_TIMEOUT_MS", 30000));
    config.idle_wait = std::chrono::milliseconds(get_env_int("JOBQUEUE_IDLE_WAIT_MS", 100));
    config.shutdown_timeout = std::chrono::milliseconds(get_env_int("JOBQUEUE_SHUTDOWN_TIMEOUT_MS", 30000));
    config.finished_retention = std::chrono::milliseconds(get_env_int("JOBQUEUE_FINISHED_RETENTION_MS", 300000));
    return config;
}

}  // namespace jobqueue
