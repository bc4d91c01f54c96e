#ifndef BACKOFF_POLICY_HPP
#define BACKOFF_POLICY_HPP

/**
 * @file backoff_policy.hpp
 * @brief Exponential delay between broker connection attempts
 */

#include <chrono>

class BackoffPolicy {
public:
    BackoffPolicy(std::chrono::seconds initial, std::chrono::seconds maximum,
                  double multiplier = 2.0);

    /** @brief Delay before the next attempt, grows until maximum */
    std::chrono::seconds nextDelay();
    void reset();

    int attempts() const { return attempts_; }

private:
    std::chrono::seconds initial_;
    std::chrono::seconds maximum_;
    double multiplier_;
    std::chrono::seconds current_;
    int attempts_;
};

#endif // BACKOFF_POLICY_HPP
