#include "classifier.hpp"
#include <stdexcept>
#include <utility>

namespace jobqueue {

ThresholdClassifier::ThresholdClassifier(std::unordered_set<std::string> high_value_customers,
                                         std::int64_t high_threshold, std::int64_t medium_threshold)
    : high_value_customers_(std::move(high_value_customers)), high_threshold_(high_threshold),
      medium_threshold_(medium_threshold) {
    if (medium_threshold_ > high_threshold_) {
        throw std::invalid_argument("Medium threshold must not exceed high threshold");
    }
}

TaskPriority ThresholdClassifier::operator()(const TaskAttributes &attributes) const {
    if (high_value_customers_.count(attributes.customer_id) > 0 || attributes.amount_minor >= high_threshold_) {
        return TaskPriority::High;
    }
    if (attributes.amount_minor >= medium_threshold_) {
        return TaskPriority::Medium;
    }
    return TaskPriority::Low;
}

}  // namespace jobqueue
