#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "input_module/device_descriptor.hpp"
#include "input_module/device_transport.hpp"
#include "input_module/dispatch_state.hpp"
#include "input_module/expected.hpp"
#include "input_module/frame_codec.hpp"
#include "input_module/retry_policy.hpp"

namespace fw::iom {

// Writes command frames through a transport and applies the retry policy.
// Not thread-safe: one caller drives a dispatcher at a time.
class CommandDispatcher {
public:
    CommandDispatcher(DeviceDescriptor descriptor, TransportFactory& factory, RetryPolicy policy);
    ~CommandDispatcher();

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    // Disconnected -> Connected. Surfaces the factory's OpenError otherwise.
    expected<void> open();

    // Sends every packet of the frame in order and returns the concatenated
    // responses. Transient failures are retried per policy; the result is
    // terminal for this call.
    expected<std::vector<std::uint8_t>> execute(const CommandFrame& frame);

    // Releases the transport and returns to Disconnected. Idempotent.
    void close() noexcept;

    [[nodiscard]] const SessionState& state() const noexcept { return state_; }
    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] const DeviceDescriptor& descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] std::uint64_t writeAttempts() const noexcept { return write_attempts_; }
    [[nodiscard]] std::uint32_t reopenCount() const noexcept { return reopen_count_; }

private:
    IoOutcome sendPacket(const wire::Packet& packet, std::vector<std::uint8_t>& response);
    bool reopenTransport();
    void releaseTransport() noexcept;

    DeviceDescriptor descriptor_;
    TransportFactory& factory_;
    const RetryPolicy policy_;
    std::unique_ptr<DeviceTransport> transport_;
    SessionState state_;
    std::uint64_t write_attempts_{0};
    std::uint32_t reopen_count_{0};
};

}  // namespace fw::iom
