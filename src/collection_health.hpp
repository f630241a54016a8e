#pragma once

#include <cstddef>

/**
 * HealthStatus - Fill level of a bounded collection
 *
 * The enumerator value is the usage percentage at which the level starts.
 * Anything under ACCEPTABLE behaves well with the default object cache of
 * the host store; performance drops off past that point.
 */
enum class HealthStatus : int {
    Healthy = 0,
    Acceptable = 60,
    Alert = 70,
    Warning = 80,
    Critical = 90
};

// Fraction of capacity in use; capacity must be non-zero
double usageFraction(size_t size, size_t capacity);

// Highest level whose threshold does not exceed ceil(usage * 100)
HealthStatus healthStatusFor(size_t size, size_t capacity);

const char* healthStatusName(HealthStatus status);
