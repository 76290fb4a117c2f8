#include "backoff_policy.hpp"
#include <algorithm>

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds b, std::chrono::milliseconds m)
    : base(b), max(std::max(b, m)), failures(0) {}

void BackoffPolicy::recordFailure() {
    ++failures;
}

void BackoffPolicy::reset() {
    failures = 0;
}

std::chrono::milliseconds BackoffPolicy::currentDelay() const {
    if (failures < 2) {
        return std::chrono::milliseconds(0);
    }
    std::chrono::milliseconds delay = base;
    for (int i = 2; i < failures && delay < max; ++i) {
        delay *= 2;
    }
    return std::min(delay, max);
}
