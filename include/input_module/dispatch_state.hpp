#pragma once

#include <chrono>
#include <cstdint>
#include <system_error>

#include "input_module/retry_policy.hpp"

namespace fw::iom {

enum class SessionPhase : std::uint8_t {
    Disconnected,
    Connected,
    Degraded,
    Failed,
};

[[nodiscard]] const char* toString(SessionPhase phase) noexcept;

// Degraded carries the number of consecutive failed attempts.
struct SessionState {
    SessionPhase phase{SessionPhase::Disconnected};
    std::uint32_t retry_count{0};

    [[nodiscard]] bool canSend() const noexcept {
        return phase == SessionPhase::Connected || phase == SessionPhase::Degraded;
    }
};

inline bool operator==(const SessionState& lhs, const SessionState& rhs) {
    return lhs.phase == rhs.phase && lhs.retry_count == rhs.retry_count;
}

inline bool operator!=(const SessionState& lhs, const SessionState& rhs) {
    return !(lhs == rhs);
}

// Result of one physical write (and its response read, if any).
enum class IoOutcome : std::uint8_t {
    Ok,
    Timeout,
    ShortWrite,
    Disconnected,
};

[[nodiscard]] IoOutcome classifyIoError(const std::error_code& error) noexcept;

enum class RecoveryAction : std::uint8_t {
    Proceed,   // continue with the next packet
    Backoff,   // sleep for delay, then resend the same packet
    Reopen,    // sleep for delay, reopen the transport, restart the frame
    GiveUp,    // terminal: report error to the caller
};

struct Transition {
    SessionState next;
    RecoveryAction action{RecoveryAction::Proceed};
    std::chrono::milliseconds delay{0};
    std::error_code error;
};

[[nodiscard]] Transition onOpen(bool opened) noexcept;

// reopens is the number of reopens already performed for the current logical
// command.
[[nodiscard]] Transition onIoOutcome(const SessionState& state,
                                     IoOutcome outcome,
                                     const RetryPolicy& policy,
                                     std::uint32_t reopens) noexcept;

[[nodiscard]] Transition onReopen(const SessionState& state, bool reopened) noexcept;

}  // namespace fw::iom
