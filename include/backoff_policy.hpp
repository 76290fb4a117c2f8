#ifndef BACKOFF_POLICY_H
#define BACKOFF_POLICY_H

#include <chrono>

/**
 * @class BackoffPolicy
 * @brief Exponential reconnect delay after consecutive link failures.
 *
 * The first failure allows an immediate reconnect. From the second
 * consecutive failure on, the delay starts at the base and doubles with each
 * further failure until it reaches the ceiling.
 */
class BackoffPolicy {
public:
    BackoffPolicy(std::chrono::milliseconds base = std::chrono::milliseconds(1000),
                  std::chrono::milliseconds max = std::chrono::milliseconds(60000));

    void recordFailure();
    void reset();

    /// @brief Delay to wait before the next reconnect attempt.
    std::chrono::milliseconds currentDelay() const;

    int consecutiveFailures() const { return failures; }

private:
    std::chrono::milliseconds base;
    std::chrono::milliseconds max;
    int failures;
};

#endif // BACKOFF_POLICY_H
