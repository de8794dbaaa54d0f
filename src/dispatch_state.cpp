#include "input_module/dispatch_state.hpp"

#include "input_module/errors.hpp"

namespace fw::iom {

const char* toString(SessionPhase phase) noexcept {
    switch (phase) {
        case SessionPhase::Disconnected:
            return "disconnected";
        case SessionPhase::Connected:
            return "connected";
        case SessionPhase::Degraded:
            return "degraded";
        case SessionPhase::Failed:
            return "failed";
    }
    return "unknown";
}

IoOutcome classifyIoError(const std::error_code& error) noexcept {
    if (!error) {
        return IoOutcome::Ok;
    }
    if (error == WriteError::Timeout || error == ReadError::Timeout) {
        return IoOutcome::Timeout;
    }
    if (error == WriteError::ShortWrite) {
        return IoOutcome::ShortWrite;
    }
    return IoOutcome::Disconnected;
}

Transition onOpen(bool opened) noexcept {
    Transition transition;
    if (opened) {
        transition.next = {SessionPhase::Connected, 0};
        return transition;
    }
    transition.next = {SessionPhase::Disconnected, 0};
    transition.action = RecoveryAction::GiveUp;
    return transition;
}

Transition onIoOutcome(const SessionState& state,
                       IoOutcome outcome,
                       const RetryPolicy& policy,
                       std::uint32_t reopens) noexcept {
    Transition transition;
    transition.next = state;

    if (state.phase == SessionPhase::Failed) {
        transition.action = RecoveryAction::GiveUp;
        transition.error = make_error_code(SendError::SessionFailed);
        return transition;
    }
    if (state.phase == SessionPhase::Disconnected) {
        transition.action = RecoveryAction::GiveUp;
        transition.error = make_error_code(SendError::NotConnected);
        return transition;
    }

    if (outcome == IoOutcome::Ok) {
        transition.next = {SessionPhase::Connected, 0};
        return transition;
    }

    const std::uint32_t failures = state.retry_count + 1;

    if (outcome == IoOutcome::Disconnected && !policy.allow_reopen) {
        transition.next = {SessionPhase::Failed, failures};
        transition.action = RecoveryAction::GiveUp;
        transition.error = make_error_code(SendError::Disconnected);
        return transition;
    }

    // A disconnect is bounded by the reopen budget alone; earlier timeouts on
    // the same packet do not use it up.
    const bool exhausted = outcome == IoOutcome::Disconnected ? reopens >= policy.max_retries
                                                              : failures >= policy.max_retries;
    if (exhausted) {
        transition.next = {SessionPhase::Failed, failures};
        transition.action = RecoveryAction::GiveUp;
        transition.error = make_error_code(SendError::RetriesExhausted);
        return transition;
    }

    transition.next = {SessionPhase::Degraded, failures};
    transition.action = outcome == IoOutcome::Disconnected ? RecoveryAction::Reopen
                                                           : RecoveryAction::Backoff;
    transition.delay = policy.backoffFor(failures);
    return transition;
}

Transition onReopen(const SessionState& state, bool reopened) noexcept {
    Transition transition;
    if (reopened) {
        transition.next = {SessionPhase::Connected, 0};
        return transition;
    }
    transition.next = {SessionPhase::Failed, state.retry_count};
    transition.action = RecoveryAction::GiveUp;
    transition.error = make_error_code(SendError::Disconnected);
    return transition;
}

}  // namespace fw::iom
