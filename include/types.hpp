#pragma once

#include <optional>
#include <string>

namespace jobqueue {

// Меньшее значение - более высокий приоритет. Порядок перечисления задаёт порядок обхода очередей.
enum class TaskPriority { High = 0, Medium = 1, Low = 2 };

const char *ToString(TaskPriority priority);

// Результат постановки в очередь: Shutdown - очередь остановлена, задача не принята
enum class EnqueueStatus { Ok, Shutdown };

namespace queue {

struct QueueOptions {
    bool bounded = false;
    std::optional<int> capacity;  // Обязательна для ограниченной очереди
};

}  // namespace queue

}  // namespace jobqueue
