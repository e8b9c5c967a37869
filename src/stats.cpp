#include "stats.hpp"

namespace jobqueue {

const char *ToString(HealthStatus status) {
    switch (status) {
    case HealthStatus::Healthy:
        return "healthy";
    case HealthStatus::Degraded:
        return "degraded";
    case HealthStatus::Unhealthy:
        return "unhealthy";
    }
    return "unknown";
}

}  // namespace jobqueue
