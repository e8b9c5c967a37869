#include "retry/retry_policy.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>

namespace jobqueue::retry {

namespace {

// Ограничиваем показатель степени, чтобы сдвиг не переполнился
constexpr int kMaxExponent = 30;

double JitterFactor() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<double> dist(0.5, 1.0);
    return dist(gen);
}

}  // namespace

const char *ToString(RetryStrategy strategy) {
    switch (strategy) {
    case RetryStrategy::Exponential:
        return "exponential";
    case RetryStrategy::Linear:
        return "linear";
    case RetryStrategy::Fixed:
        return "fixed";
    case RetryStrategy::None:
        return "none";
    }
    return "unknown";
}

RetryStrategy ParseRetryStrategy(const std::string &name) {
    if (name == "exponential") {
        return RetryStrategy::Exponential;
    }
    if (name == "linear") {
        return RetryStrategy::Linear;
    }
    if (name == "fixed") {
        return RetryStrategy::Fixed;
    }
    if (name == "none") {
        return RetryStrategy::None;
    }
    throw std::invalid_argument("Unknown retry strategy: " + name);
}

std::chrono::milliseconds ComputeDelay(const RetryPolicy &policy, int retry_count) {
    if (retry_count < 1) {
        throw std::invalid_argument("retry_count must be at least 1");
    }

    const long long base = policy.base_delay.count();
    const long long cap = policy.max_delay.count();
    long long delay = 0;

    switch (policy.strategy) {
    case RetryStrategy::Exponential: {
        const int exponent = std::min(retry_count - 1, kMaxExponent);
        const long long factor = 1LL << exponent;
        // base * factor может переполниться только если уже больше cap
        delay = (base > 0 && factor > cap / base) ? cap : std::min(base * factor, cap);
        break;
    }
    case RetryStrategy::Linear:
        delay = (base > 0 && retry_count > cap / base) ? cap : std::min(base * retry_count, cap);
        break;
    case RetryStrategy::Fixed:
        delay = std::min(base, cap);
        break;
    case RetryStrategy::None:
        delay = 0;
        break;
    }

    if (policy.jitter && delay > 0) {
        delay = static_cast<long long>(static_cast<double>(delay) * JitterFactor());
    }
    return std::chrono::milliseconds(delay);
}

RetryDecision DecideOnFailure(const RetryPolicy &policy, Task &task, const TaskResult &result) {
    task.retry_count += 1;
    task.last_error = result.reason();

    if (result.kind() == ResultKind::PermanentFailure) {
        return {RetryAction::DeadLetter, std::chrono::milliseconds(0), result.reason()};
    }
    if (policy.strategy == RetryStrategy::None) {
        return {RetryAction::DeadLetter, std::chrono::milliseconds(0), kRetriesDisabled};
    }
    if (task.retry_count > task.max_retries) {
        return {RetryAction::DeadLetter, std::chrono::milliseconds(0), kMaxRetriesExceeded};
    }
    return {RetryAction::Retry, ComputeDelay(policy, task.retry_count), {}};
}

}  // namespace jobqueue::retry
