#include "collection_health.hpp"

static constexpr HealthStatus LEVELS[] = {
    HealthStatus::Healthy,
    HealthStatus::Acceptable,
    HealthStatus::Alert,
    HealthStatus::Warning,
    HealthStatus::Critical
};

double usageFraction(size_t size, size_t capacity) {
    return static_cast<double>(size) / static_cast<double>(capacity);
}

HealthStatus healthStatusFor(size_t size, size_t capacity) {
    if (capacity == 0) return HealthStatus::Healthy;

    // ceil(size * 100 / capacity) in integer arithmetic
    size_t percent = (size * 100 + capacity - 1) / capacity;

    HealthStatus result = HealthStatus::Healthy;
    for (HealthStatus level : LEVELS) {
        if (static_cast<size_t>(level) <= percent) {
            result = level;
        }
    }
    return result;
}

const char* healthStatusName(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:    return "HEALTHY";
        case HealthStatus::Acceptable: return "ACCEPTABLE";
        case HealthStatus::Alert:      return "ALERT";
        case HealthStatus::Warning:    return "WARNING";
        case HealthStatus::Critical:   return "CRITICAL";
    }
    return "UNKNOWN";
}
