#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace fw::iom {

// Fixed for the lifetime of a session.
struct RetryPolicy {
    // Consecutive failed attempts of one packet tolerated before the session
    // fails. Must be at least 1.
    std::uint32_t max_retries{3};
    // Delay before retry n is backoff[n - 1]; the last entry repeats.
    std::vector<std::chrono::milliseconds> backoff{std::chrono::milliseconds{10},
                                                   std::chrono::milliseconds{20},
                                                   std::chrono::milliseconds{40}};
    bool allow_reopen{true};
    std::chrono::milliseconds write_timeout{100};
    std::chrono::milliseconds read_timeout{100};

    [[nodiscard]] std::chrono::milliseconds backoffFor(std::uint32_t failure_count) const noexcept;

    // Throws std::invalid_argument when a field is outside its legal range.
    void validate() const;

    [[nodiscard]] static std::vector<std::chrono::milliseconds> exponentialBackoff(
        std::chrono::milliseconds initial, std::uint32_t steps);
};

}  // namespace fw::iom
