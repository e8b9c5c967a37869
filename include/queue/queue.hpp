#pragma once

#include "task.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace jobqueue::queue {

// Одна полоса приоритета: FIFO без блокировок ожидания.
// Ожидание свободного места и выбор полосы выполняет PriorityQueue.
class IQueue {
public:
    virtual ~IQueue() = default;

    // Вызывающий обязан проверить full(); добавление в заполненную полосу - нарушение инварианта
    virtual void push(Task task) = 0;

    virtual std::optional<Task> try_pop() = 0;

    // Извлекает задачу с данным id из любой позиции (отмена)
    virtual std::optional<Task> extract(const std::string &task_id) = 0;

    virtual std::vector<Task> drain() = 0;

    virtual bool full() const = 0;

    virtual size_t size() const = 0;
};

}  // namespace jobqueue::queue
