#include "input_module/device_session.hpp"

#include <iostream>
#include <memory>
#include <utility>

#include "input_module/device_bus.hpp"
#include "input_module/errors.hpp"
#include "input_module/frame_codec.hpp"

namespace fw::iom {

expected<std::unique_ptr<DeviceSession>> DeviceSession::open(DeviceBus& bus,
                                                             const DeviceDescriptor& descriptor,
                                                             RetryPolicy policy) {
    return open(bus.transports(), bus.leases(), descriptor, std::move(policy));
}

expected<std::unique_ptr<DeviceSession>> DeviceSession::open(TransportFactory& factory,
                                                             DeviceLeaseTable& leases,
                                                             const DeviceDescriptor& descriptor,
                                                             RetryPolicy policy) {
    policy.validate();

    auto lease = leases.acquire(descriptor.path());
    if (!lease) {
        std::cerr << "[DeviceSession] " << descriptor.describe() << " is already in use" << '\n';
        return unexpected(lease.error());
    }

    auto session = std::make_unique<DeviceSession>(Key{}, std::move(*lease), descriptor, factory,
                                                   std::move(policy));
    auto opened = session->dispatcher_.open();
    if (!opened) {
        return unexpected(opened.error());
    }
    return std::move(session);
}

DeviceSession::DeviceSession(Key /*key*/,
                             DeviceLease lease,
                             const DeviceDescriptor& descriptor,
                             TransportFactory& factory,
                             RetryPolicy policy)
    : lease_(std::move(lease)),
      dispatcher_(descriptor, factory, std::move(policy)) {}

DeviceSession::~DeviceSession() {
    close();
}

expected<void> DeviceSession::draw(const PixelMatrix& matrix) {
    return send(encodeFrame(matrix, kind()));
}

expected<void> DeviceSession::drawMonochrome(const PixelMatrix& matrix) {
    return send(encodeMonochromeFrame(matrix, kind()));
}

expected<void> DeviceSession::setBrightness(int level) {
    return send(encodeBrightness(level, kind()));
}

expected<DeviceStatus> DeviceSession::queryStatus() {
    auto query = encodeStatusQuery(kind());
    if (!query) {
        return unexpected(query.error());
    }
    auto responses = dispatcher_.execute(*query);
    if (!responses) {
        return unexpected(responses.error());
    }
    return decodeStatus(*responses);
}

expected<void> DeviceSession::setPattern(const Pattern& pattern) {
    return send(encodePattern(pattern, kind()));
}

expected<void> DeviceSession::setSleep(bool sleeping) {
    return send(encodeSleep(sleeping, kind()));
}

expected<void> DeviceSession::setAnimation(bool animate) {
    return send(encodeAnimation(animate, kind()));
}

void DeviceSession::close() noexcept {
    dispatcher_.close();
    lease_.release();
}

expected<void> DeviceSession::send(const expected<CommandFrame>& frame) {
    // Encode failures never reach the device and leave the state untouched.
    if (!frame) {
        return unexpected(frame.error());
    }
    auto sent = dispatcher_.execute(*frame);
    if (!sent) {
        return unexpected(sent.error());
    }
    return {};
}

}  // namespace fw::iom
