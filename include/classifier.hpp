#pragma once

#include "types.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>

namespace jobqueue {

// Атрибуты, которые продюсер передаёт для выбора приоритета
struct TaskAttributes {
    std::string customer_id;
    std::int64_t amount_minor = 0;  // Сумма в минимальных единицах валюты
};

using PriorityClassifier = std::function<TaskPriority(const TaskAttributes &)>;

// Известный клиент или сумма >= high_threshold -> High; сумма >= medium_threshold -> Medium; иначе Low
class ThresholdClassifier {
private:
    std::unordered_set<std::string> high_value_customers_;
    std::int64_t high_threshold_;
    std::int64_t medium_threshold_;

public:
    ThresholdClassifier(std::unordered_set<std::string> high_value_customers, std::int64_t high_threshold,
                        std::int64_t medium_threshold);

    TaskPriority operator()(const TaskAttributes &attributes) const;
};

}  // namespace jobqueue
