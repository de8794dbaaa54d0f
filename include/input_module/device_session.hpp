#pragma once

#include <cstdint>
#include <memory>

#include "input_module/command_dispatcher.hpp"
#include "input_module/device_descriptor.hpp"
#include "input_module/device_lease.hpp"
#include "input_module/device_transport.hpp"
#include "input_module/expected.hpp"
#include "input_module/pixel_matrix.hpp"
#include "input_module/retry_policy.hpp"
#include "input_module/types.hpp"

namespace fw::iom {

class DeviceBus;

// Open connection to one module. Each call is one logical unit of work that
// may retry internally but always ends in a single success or error. A session
// must be driven by one caller at a time; sessions for different devices are
// independent.
class DeviceSession {
    // Restricts construction to open() while still allowing make_unique.
    class Key {
        friend class DeviceSession;
        Key() {}
    };

public:
    // Throws std::invalid_argument for an invalid policy. Fails with
    // OpenError::AlreadyHeld when another session owns the device path.
    static expected<std::unique_ptr<DeviceSession>> open(DeviceBus& bus,
                                                         const DeviceDescriptor& descriptor,
                                                         RetryPolicy policy = {});

    static expected<std::unique_ptr<DeviceSession>> open(TransportFactory& factory,
                                                         DeviceLeaseTable& leases,
                                                         const DeviceDescriptor& descriptor,
                                                         RetryPolicy policy = {});

    DeviceSession(Key key,
                  DeviceLease lease,
                  const DeviceDescriptor& descriptor,
                  TransportFactory& factory,
                  RetryPolicy policy);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    expected<void> draw(const PixelMatrix& matrix);
    // On/off rendition of the matrix in a single packet.
    expected<void> drawMonochrome(const PixelMatrix& matrix);
    expected<void> setBrightness(int level);
    expected<DeviceStatus> queryStatus();

    expected<void> setPattern(const Pattern& pattern);
    expected<void> setSleep(bool sleeping);
    expected<void> setAnimation(bool animate);

    // Releases the transport and the device lease. Idempotent.
    void close() noexcept;

    [[nodiscard]] const DeviceDescriptor& descriptor() const noexcept { return dispatcher_.descriptor(); }
    [[nodiscard]] DeviceKind kind() const noexcept { return dispatcher_.descriptor().kind(); }
    [[nodiscard]] const SessionState& state() const noexcept { return dispatcher_.state(); }
    [[nodiscard]] const RetryPolicy& policy() const noexcept { return dispatcher_.policy(); }
    [[nodiscard]] std::uint64_t writeAttempts() const noexcept { return dispatcher_.writeAttempts(); }
    [[nodiscard]] std::uint32_t reopenCount() const noexcept { return dispatcher_.reopenCount(); }

private:
    expected<void> send(const expected<CommandFrame>& frame);

    DeviceLease lease_;
    CommandDispatcher dispatcher_;
};

}  // namespace fw::iom
