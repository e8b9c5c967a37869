#pragma once
#include "queue/queue.hpp"
#include <deque>
#include <mutex>

namespace jobqueue::queue {

class BoundedQueue : public IQueue {
private:
    mutable std::mutex mutex_;  // Защита доступа к внутренним данным
    std::deque<Task> queue_;
    const int capacity_;

public:
    explicit BoundedQueue(int capacity);

    void push(Task task) override;

    std::optional<Task> try_pop() override;

    std::optional<Task> extract(const std::string &task_id) override;

    std::vector<Task> drain() override;

    bool full() const override;

    size_t size() const override;

    int capacity() const { return capacity_; }

    ~BoundedQueue() override;
};

}  // namespace jobqueue::queue
