#include "task.hpp"
#include <array>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace jobqueue {

TaskResult::TaskResult(ResultKind kind, std::string reason) : kind_(kind), reason_(std::move(reason)) {}

TaskResult TaskResult::Ok() { return TaskResult(ResultKind::Success, {}); }

TaskResult TaskResult::Retry(std::string reason) { return TaskResult(ResultKind::RetryableFailure, std::move(reason)); }

TaskResult TaskResult::Permanent(std::string reason) {
    return TaskResult(ResultKind::PermanentFailure, std::move(reason));
}

std::string GenerateTaskId() {
    static std::mutex id_mutex;
    static uint64_t last_ms = 0;
    static uint16_t sequence = 0;
    static std::mt19937_64 gen(std::random_device{}());

    std::lock_guard<std::mutex> lock(id_mutex);

    auto now = std::chrono::system_clock::now();
    uint64_t current_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    // В пределах одной миллисекунды уникальность обеспечивает счётчик
    if (current_ms <= last_ms) {
        sequence++;
    } else {
        last_ms = current_ms;
        sequence = 0;
    }

    std::array<uint8_t, 16> bytes;

    // 48 бит времени в миллисекундах (big-endian)
    for (int i = 0; i < 6; ++i) {
        bytes[i] = static_cast<uint8_t>((last_ms >> (40 - 8 * i)) & 0xFF);
    }

    // Версия 7 и 12 бит счётчика
    uint16_t sequence_bits = sequence & 0x0FFF;
    bytes[6] = static_cast<uint8_t>(0x70 | (sequence_bits >> 8));
    bytes[7] = static_cast<uint8_t>(sequence_bits & 0xFF);

    // Вариант (10) и 62 случайных бита
    uint64_t rand_data = gen();
    bytes[8] = static_cast<uint8_t>(0x80 | ((rand_data >> 56) & 0x3F));
    for (int i = 9; i < 16; ++i) {
        bytes[i] = static_cast<uint8_t>((rand_data >> (8 * (15 - i))) & 0xFF);
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

Task MakeTask(std::string task_type, Payload payload, TaskPriority priority, int max_retries) {
    if (task_type.empty()) {
        throw std::invalid_argument("Task type must not be empty");
    }
    if (max_retries < 0) {
        throw std::invalid_argument("max_retries must be non-negative");
    }

    Task task;
    task.id = GenerateTaskId();
    task.task_type = std::move(task_type);
    task.payload = std::move(payload);
    task.priority = priority;
    task.created_at = std::chrono::system_clock::now();
    task.max_retries = max_retries;
    return task;
}

}  // namespace jobqueue
