#pragma once
#include "queue/queue.hpp"
#include <deque>
#include <mutex>

namespace jobqueue::queue {

class UnboundedQueue : public IQueue {
private:
    mutable std::mutex mutex_;  // Защита доступа к внутренним данным
    std::deque<Task> queue_;

public:
    explicit UnboundedQueue();

    void push(Task task) override;

    std::optional<Task> try_pop() override;

    std::optional<Task> extract(const std::string &task_id) override;

    std::vector<Task> drain() override;

    bool full() const override { return false; }

    size_t size() const override;

    ~UnboundedQueue() override = default;
};

}  // namespace jobqueue::queue
