#include "input_module/command_dispatcher.hpp"

#include <iostream>
#include <thread>
#include <utility>

#include "input_module/errors.hpp"

namespace fw::iom {

CommandDispatcher::CommandDispatcher(DeviceDescriptor descriptor,
                                     TransportFactory& factory,
                                     RetryPolicy policy)
    : descriptor_(std::move(descriptor)),
      factory_(factory),
      policy_(std::move(policy)) {}

CommandDispatcher::~CommandDispatcher() {
    close();
}

expected<void> CommandDispatcher::open() {
    if (state_.canSend()) {
        return {};
    }

    auto opened = factory_.open(descriptor_);
    state_ = onOpen(opened.has_value()).next;
    if (!opened) {
        return unexpected(opened.error());
    }
    transport_ = std::move(*opened);
    return {};
}

expected<std::vector<std::uint8_t>> CommandDispatcher::execute(const CommandFrame& frame) {
    if (state_.phase == SessionPhase::Failed) {
        return unexpected(make_error_code(SendError::SessionFailed));
    }
    if (state_.phase == SessionPhase::Disconnected) {
        return unexpected(make_error_code(SendError::NotConnected));
    }

    std::vector<std::uint8_t> responses;
    std::vector<std::uint8_t> response;
    std::uint32_t reopens = 0;
    std::size_t index = 0;

    while (index < frame.packets.size()) {
        const auto outcome = sendPacket(frame.packets[index], response);
        const auto transition = onIoOutcome(state_, outcome, policy_, reopens);
        state_ = transition.next;

        switch (transition.action) {
            case RecoveryAction::Proceed:
                responses.insert(responses.end(), response.begin(), response.end());
                ++index;
                break;

            case RecoveryAction::Backoff:
                std::cerr << "[DeviceSession] " << descriptor_.path() << ": attempt "
                          << state_.retry_count << '/' << policy_.max_retries
                          << " failed, retrying in " << transition.delay.count() << "ms" << '\n';
                std::this_thread::sleep_for(transition.delay);
                break;

            case RecoveryAction::Reopen: {
                std::cerr << "[DeviceSession] " << descriptor_.path()
                          << ": device disconnected, reopening in "
                          << transition.delay.count() << "ms" << '\n';
                std::this_thread::sleep_for(transition.delay);
                ++reopens;
                ++reopen_count_;
                const auto reopened = onReopen(state_, reopenTransport());
                state_ = reopened.next;
                if (reopened.action == RecoveryAction::GiveUp) {
                    std::cerr << "[DeviceSession] " << descriptor_.describe()
                              << " failed: " << reopened.error.message() << '\n';
                    releaseTransport();
                    return unexpected(reopened.error);
                }
                // The device may have lost staged state; resend from the start.
                responses.clear();
                index = 0;
                break;
            }

            case RecoveryAction::GiveUp:
                std::cerr << "[DeviceSession] " << descriptor_.describe()
                          << " failed: " << transition.error.message() << '\n';
                releaseTransport();
                return unexpected(transition.error);
        }
    }

    return responses;
}

void CommandDispatcher::close() noexcept {
    releaseTransport();
    state_ = SessionState{};
}

IoOutcome CommandDispatcher::sendPacket(const wire::Packet& packet, std::vector<std::uint8_t>& response) {
    response.clear();
    if (!transport_ || !transport_->isOpen()) {
        return IoOutcome::Disconnected;
    }

    ++write_attempts_;

    auto written = transport_->write(packet.bytes, policy_.write_timeout);
    if (!written) {
        return classifyIoError(written.error());
    }
    if (packet.response_length == 0) {
        return IoOutcome::Ok;
    }

    response.assign(packet.response_length, 0);
    auto received = transport_->read(response, policy_.read_timeout);
    if (!received) {
        response.clear();
        return classifyIoError(received.error());
    }
    response.resize(*received);
    return IoOutcome::Ok;
}

bool CommandDispatcher::reopenTransport() {
    releaseTransport();
    auto opened = factory_.open(descriptor_);
    if (!opened) {
        std::cerr << "[DeviceSession] reopen of " << descriptor_.path() << " failed: "
                  << opened.error().message() << '\n';
        return false;
    }
    transport_ = std::move(*opened);
    std::cout << "[DeviceSession] reopened " << descriptor_.describe() << '\n';
    return true;
}

void CommandDispatcher::releaseTransport() noexcept {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}

}  // namespace fw::iom
