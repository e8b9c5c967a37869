#pragma once

#include <stdexcept>

namespace jobqueue {

// Нарушение внутреннего инварианта (задача в двух местах, порча учёта ёмкости).
// Для рабочих потоков фатально: состояние очереди больше не согласовано.
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Очередь остановлена и больше не принимает задачи
class QueueShutdownError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace jobqueue
