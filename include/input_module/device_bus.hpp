#pragma once

#include <memory>
#include <string>
#include <vector>

#include "input_module/device_descriptor.hpp"
#include "input_module/device_lease.hpp"
#include "input_module/device_registry.hpp"
#include "input_module/device_signature.hpp"
#include "input_module/device_transport.hpp"
#include "input_module/expected.hpp"
#include "input_module/retry_policy.hpp"

namespace fw::iom {

class DeviceSession;

// Entry point for callers: discovers modules and opens sessions on them. Owns
// the registry, the transport factory and the lease table; it must outlive
// every session opened through it.
class DeviceBus {
public:
    DeviceBus(std::unique_ptr<DeviceRegistry> registry,
              std::unique_ptr<TransportFactory> transports,
              SignatureTable signatures = SignatureTable::builtin());
    ~DeviceBus();

    DeviceBus(const DeviceBus&) = delete;
    DeviceBus& operator=(const DeviceBus&) = delete;

    [[nodiscard]] std::vector<DeviceDescriptor> discover() const;
    [[nodiscard]] std::vector<DeviceDescriptor> discover(DeviceKind kind) const;

    expected<std::unique_ptr<DeviceSession>> openSession(const DeviceDescriptor& descriptor,
                                                         RetryPolicy policy = {});

    [[nodiscard]] TransportFactory& transports() noexcept { return *transports_; }
    [[nodiscard]] DeviceLeaseTable& leases() noexcept { return leases_; }
    [[nodiscard]] const SignatureTable& signatures() const noexcept { return signatures_; }

private:
    std::unique_ptr<DeviceRegistry> registry_;
    std::unique_ptr<TransportFactory> transports_;
    const SignatureTable signatures_;
    DeviceLeaseTable leases_;
};

// Builds a bus for a transport id: "hidapi" or "logging". Throws
// std::runtime_error for anything else.
[[nodiscard]] std::unique_ptr<DeviceBus> makeBus(const std::string& transport_id,
                                                 SignatureTable signatures = SignatureTable::builtin());

}  // namespace fw::iom
