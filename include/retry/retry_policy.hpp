#pragma once

#include "task.hpp"
#include <chrono>
#include <string>

namespace jobqueue::retry {

enum class RetryStrategy { Exponential, Linear, Fixed, None };

const char *ToString(RetryStrategy strategy);

// Бросает std::invalid_argument для неизвестного имени
RetryStrategy ParseRetryStrategy(const std::string &name);

struct RetryPolicy {
    RetryStrategy strategy = RetryStrategy::Exponential;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{300000};
    bool jitter = false;  // Случайный множитель [0.5, 1.0]
};

// Задержка перед повтором номер retry_count (начиная с 1).
// Exponential: min(base * 2^(n-1), max); Linear: min(base * n, max); Fixed: min(base, max).
std::chrono::milliseconds ComputeDelay(const RetryPolicy &policy, int retry_count);

enum class RetryAction { Retry, DeadLetter };

struct RetryDecision {
    RetryAction action;
    std::chrono::milliseconds delay{0};
    std::string reason;  // Причина для dead-letter
};

inline constexpr const char *kMaxRetriesExceeded = "max retries exceeded";
inline constexpr const char *kRetriesDisabled = "retries disabled";

// Учитывает неудачную попытку: увеличивает retry_count ровно на единицу, запоминает причину
// и решает, повторять ли задачу. Повтор возможен, пока retry_count <= max_retries.
RetryDecision DecideOnFailure(const RetryPolicy &policy, Task &task, const TaskResult &result);

}  // namespace jobqueue::retry
