#pragma once

#include "task.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace jobqueue::dead_letter {

struct DeadLetterRecord {
    Task task;
    std::string reason;
    std::chrono::system_clock::time_point dead_lettered_at;
};

// Конечное хранилище задач, исчерпавших повторы.
// Записи только добавляются и не изменяются; автоматического повтора из sink нет.
// Повторная отправка - явное действие вызывающего (take() и новая задача).
class DeadLetterSink {
private:
    mutable std::mutex mutex_;
    std::vector<DeadLetterRecord> records_;  // В порядке поступления

public:
    DeadLetterSink() = default;

    DeadLetterSink(const DeadLetterSink &) = delete;
    DeadLetterSink &operator=(const DeadLetterSink &) = delete;

    void add(Task task, std::string reason);

    // Возвращает запись, изъятую take(), если её не удалось отправить повторно
    void restore(DeadLetterRecord record);

    // Снимок записей; повторный вызов начинает обход заново
    std::vector<DeadLetterRecord> list() const;

    std::optional<DeadLetterRecord> take(const std::string &task_id);

    // Передаёт все записи вызывающему и очищает хранилище
    std::vector<DeadLetterRecord> drain();

    size_t size() const;
};

}  // namespace jobqueue::dead_letter
