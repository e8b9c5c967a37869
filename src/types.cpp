#include "types.hpp"

namespace jobqueue {

const char *ToString(TaskPriority priority) {
    switch (priority) {
    case TaskPriority::High:
        return "high";
    case TaskPriority::Medium:
        return "medium";
    case TaskPriority::Low:
        return "low";
    }
    return "unknown";
}

}  // namespace jobqueue
