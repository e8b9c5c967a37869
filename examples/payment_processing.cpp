#include "job_queue.hpp"
#include <chrono>
#include <cstdint>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

using namespace jobqueue;

namespace {

struct Payment {
    std::string payment_id;
    std::string customer_id;
    std::int64_t amount_minor = 0;
};

TaskResult FraudCheck(const Payload &payload) {
    const auto &payment = std::any_cast<const Payment &>(payload);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    if (payment.amount_minor <= 0) {
        return TaskResult::Permanent("non-positive amount");
    }
    spdlog::info("Fraud check passed for {}", payment.payment_id);
    return TaskResult::Ok();
}

TaskResult ChargeCard(const Payload &payload) {
    const auto &payment = std::any_cast<const Payment &>(payload);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    // Эмуляция недоступного шлюза для крупных сумм
    if (payment.amount_minor > 500000) {
        return TaskResult::Retry("card gateway unavailable");
    }
    spdlog::info("Charged {} for {}", payment.amount_minor, payment.payment_id);
    return TaskResult::Ok();
}

TaskResult SendNotification(const Payload &payload) {
    const auto &payment = std::any_cast<const Payment &>(payload);
    spdlog::info("Notification sent for {}", payment.payment_id);
    return TaskResult::Ok();
}

}  // namespace

int main() {
    spdlog::set_level(spdlog::level::from_str(get_env_string("JOBQUEUE_LOG_LEVEL", "info")));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    JobQueueConfig config = JobQueueConfig::from_env();
    config.retry.base_delay = std::chrono::milliseconds(100);
    config.retry.max_delay = std::chrono::milliseconds(1000);
    config.classifier = ThresholdClassifier({"vip_customer"}, 100000, 5000);

    JobQueue queue(config);
    queue.register_handler("fraud_check", FraudCheck);
    queue.register_handler("charge_card", ChargeCard);
    queue.register_handler("send_notification", SendNotification);
    queue.start();

    const Payment payments[] = {
        {"pay_123", "user_456", 1000000},
        {"pay_124", "user_789", 5000},
        {"pay_125", "vip_customer", 100},
        {"pay_126", "user_000", 0},
    };

    for (const auto &payment : payments) {
        const TaskAttributes attributes{payment.customer_id, payment.amount_minor};
        queue.enqueue("fraud_check", payment, attributes);
        queue.enqueue("charge_card", payment, attributes, 2);
        queue.enqueue("send_notification", payment, TaskPriority::Low);
    }

    std::this_thread::sleep_for(std::chrono::seconds(2));

    const QueueStats stats = queue.get_stats();
    std::cout << "processed=" << stats.processed << " failed=" << stats.failed << " retried=" << stats.retried
              << " dead_lettered=" << stats.dead_lettered << " retry_pending=" << stats.retry_pending << std::endl;

    for (const auto &record : queue.list_dead_letters()) {
        std::cout << "dead letter " << record.task.id << " (" << record.task.task_type << "): " << record.reason
                  << std::endl;
    }

    const size_t remaining = queue.shutdown(std::chrono::seconds(5));
    std::cout << "unprocessed at shutdown: " << remaining << std::endl;
    return 0;
}
