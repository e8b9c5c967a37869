#include "handler_registry.hpp"
#include <mutex>
#include <stdexcept>
#include <utility>

namespace jobqueue {

void HandlerRegistry::register_handler(const std::string &task_type, TaskHandler handler) {
    if (task_type.empty()) {
        throw std::invalid_argument("Task type must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Handler for '" + task_type + "' cannot be null");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    handlers_[task_type] = std::move(handler);
}

bool HandlerRegistry::unregister_handler(const std::string &task_type) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return handlers_.erase(task_type) > 0;
}

std::optional<TaskHandler> HandlerRegistry::find(const std::string &task_type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = handlers_.find(task_type);
    if (it == handlers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool HandlerRegistry::contains(const std::string &task_type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return handlers_.count(task_type) > 0;
}

size_t HandlerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return handlers_.size();
}

}  // namespace jobqueue
