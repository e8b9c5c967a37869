#pragma once

#include "types.hpp"
#include <any>
#include <chrono>
#include <string>

namespace jobqueue {

using Payload = std::any;

constexpr int kDefaultMaxRetries = 3;

enum class ResultKind { Success, RetryableFailure, PermanentFailure };

// Итог выполнения обработчика. Permanent - повторять бессмысленно (например, неверный payload).
class TaskResult {
private:
    ResultKind kind_;
    std::string reason_;

    TaskResult(ResultKind kind, std::string reason);

public:
    static TaskResult Ok();
    static TaskResult Retry(std::string reason);
    static TaskResult Permanent(std::string reason);

    ResultKind kind() const { return kind_; }
    bool ok() const { return kind_ == ResultKind::Success; }
    const std::string &reason() const { return reason_; }
};

// Единица работы. id, task_type, payload, priority, created_at и max_retries
// не меняются после создания; retry_count и last_error ведёт планировщик повторов.
struct Task {
    std::string id;
    std::string task_type;
    Payload payload;
    TaskPriority priority = TaskPriority::Medium;
    std::chrono::system_clock::time_point created_at;
    int retry_count = 0;
    int max_retries = kDefaultMaxRetries;
    std::string last_error;
};

// UUIDv7: идентификаторы упорядочены по времени создания
std::string GenerateTaskId();

Task MakeTask(std::string task_type, Payload payload, TaskPriority priority, int max_retries = kDefaultMaxRetries);

}  // namespace jobqueue
