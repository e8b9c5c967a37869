#pragma once

#include "task.hpp"
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace jobqueue {

// Обработчик не должен сохранять ссылку на payload после возврата
using TaskHandler = std::function<TaskResult(const Payload &)>;

class HandlerRegistry {
private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TaskHandler> handlers_;

public:
    // Повторная регистрация заменяет обработчик
    void register_handler(const std::string &task_type, TaskHandler handler);

    bool unregister_handler(const std::string &task_type);

    // Копия обработчика: вызов происходит без удержания блокировки
    std::optional<TaskHandler> find(const std::string &task_type) const;

    bool contains(const std::string &task_type) const;

    size_t size() const;
};

}  // namespace jobqueue
