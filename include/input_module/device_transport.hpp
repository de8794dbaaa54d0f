#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "input_module/device_descriptor.hpp"
#include "input_module/expected.hpp"

namespace fw::iom {

// One open channel to one device. A byte pipe: payloads are not interpreted.
// Every blocking call is bounded by the timeout it is given.
class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;

    virtual std::string id() const = 0;

    // Fails with WriteError::{Timeout, ShortWrite, Disconnected}.
    virtual expected<void> write(const std::vector<std::uint8_t>& bytes,
                                 std::chrono::milliseconds timeout) = 0;

    // Reads at most buffer.size() bytes. Fails with ReadError::{Timeout, Disconnected}.
    virtual expected<std::size_t> read(std::vector<std::uint8_t>& buffer,
                                       std::chrono::milliseconds timeout) = 0;

    // Idempotent.
    virtual void close() noexcept = 0;
    virtual bool isOpen() const noexcept = 0;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    virtual std::string id() const = 0;

    // Fails with OpenError::{Unavailable, PermissionDenied, AlreadyHeld}.
    virtual expected<std::unique_ptr<DeviceTransport>> open(const DeviceDescriptor& descriptor) = 0;
};

}  // namespace fw::iom
