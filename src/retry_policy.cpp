#include "input_module/retry_policy.hpp"

#include <stdexcept>

namespace fw::iom {

std::chrono::milliseconds RetryPolicy::backoffFor(std::uint32_t failure_count) const noexcept {
    if (backoff.empty() || failure_count == 0) {
        return std::chrono::milliseconds{0};
    }
    const std::size_t index = failure_count - 1;
    if (index >= backoff.size()) {
        return backoff.back();
    }
    return backoff[index];
}

void RetryPolicy::validate() const {
    if (max_retries < 1) {
        throw std::invalid_argument("RetryPolicy: max_retries must be at least 1");
    }
    for (const auto& delay : backoff) {
        if (delay.count() < 0) {
            throw std::invalid_argument("RetryPolicy: backoff delays must not be negative");
        }
    }
    if (write_timeout.count() <= 0 || read_timeout.count() <= 0) {
        throw std::invalid_argument("RetryPolicy: timeouts must be positive");
    }
}

std::vector<std::chrono::milliseconds> RetryPolicy::exponentialBackoff(
    std::chrono::milliseconds initial, std::uint32_t steps) {
    std::vector<std::chrono::milliseconds> schedule;
    schedule.reserve(steps);
    auto delay = initial;
    for (std::uint32_t i = 0; i < steps; ++i) {
        schedule.push_back(delay);
        delay *= 2;
    }
    return schedule;
}

}  // namespace fw::iom
