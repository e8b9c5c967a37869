#include "dead_letter/dead_letter_sink.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <utility>

namespace jobqueue::dead_letter {

void DeadLetterSink::add(Task task, std::string reason) {
    spdlog::warn("[DeadLetter] Task {} (type={}, priority={}) dead-lettered after {} attempt(s): {}", task.id,
                 task.task_type, ToString(task.priority), task.retry_count, reason);

    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(DeadLetterRecord{std::move(task), std::move(reason), std::chrono::system_clock::now()});
}

void DeadLetterSink::restore(DeadLetterRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
}

std::vector<DeadLetterRecord> DeadLetterSink::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::optional<DeadLetterRecord> DeadLetterSink::take(const std::string &task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&task_id](const DeadLetterRecord &record) { return record.task.id == task_id; });
    if (it == records_.end()) {
        return std::nullopt;
    }
    DeadLetterRecord record = std::move(*it);
    records_.erase(it);
    return record;
}

std::vector<DeadLetterRecord> DeadLetterSink::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeadLetterRecord> records;
    records.swap(records_);
    return records;
}

size_t DeadLetterSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace jobqueue::dead_letter
