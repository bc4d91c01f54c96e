/**
 * @file backoff_policy.cpp
 * @brief Reconnect backoff
 */

#include "backoff_policy.hpp"
#include <algorithm>

BackoffPolicy::BackoffPolicy(std::chrono::seconds initial, std::chrono::seconds maximum,
                             double multiplier)
    : initial_(initial), maximum_(std::max(initial, maximum)),
      multiplier_(multiplier < 1.0 ? 1.0 : multiplier), current_(initial), attempts_(0) {
}

std::chrono::seconds BackoffPolicy::nextDelay() {
    const std::chrono::seconds delay = current_;
    ++attempts_;

    const auto grown = static_cast<std::chrono::seconds::rep>(
        static_cast<double>(current_.count()) * multiplier_);
    current_ = std::min(maximum_, std::chrono::seconds(std::max(grown, current_.count())));
    return delay;
}

void BackoffPolicy::reset() {
    current_ = initial_;
    attempts_ = 0;
}
