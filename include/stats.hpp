#pragma once

#include "types.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace jobqueue {

// Монотонные счётчики, общие для контроллера и рабочих потоков
struct QueueCounters {
    std::atomic<uint64_t> total_enqueued{0};
    std::atomic<uint64_t> processed{0};
    std::atomic<uint64_t> failed{0};  // Каждая неудачная попытка
    std::atomic<uint64_t> retried{0};
    std::atomic<uint64_t> dead_lettered{0};
};

struct QueueStats {
    std::map<TaskPriority, size_t> lane_sizes;
    size_t retry_pending = 0;
    size_t dead_letter_count = 0;
    size_t running = 0;
    uint64_t total_enqueued = 0;
    uint64_t processed = 0;
    uint64_t failed = 0;
    uint64_t retried = 0;
    uint64_t dead_lettered = 0;
};

struct WorkerStats {
    size_t worker_id = 0;
    uint64_t processed = 0;
    uint64_t failed = 0;
    bool busy = false;
    std::string current_task_id;
};

// Healthy - все потоки живы и успевают; Degraded - часть потоков вышла или все заняты при непустых полосах;
// Unhealthy - очередь не запущена, остановлена или живых потоков нет.
enum class HealthStatus { Healthy, Degraded, Unhealthy };

const char *ToString(HealthStatus status);

struct HealthReport {
    HealthStatus status = HealthStatus::Unhealthy;
    size_t worker_count = 0;
    size_t live_workers = 0;
    size_t busy_workers = 0;
    size_t queue_size = 0;
    size_t retry_pending = 0;
    size_t dead_letter_count = 0;
    std::chrono::milliseconds uptime{0};
};

}  // namespace jobqueue
