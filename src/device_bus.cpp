#include "input_module/device_bus.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "input_module/device_discovery.hpp"
#include "input_module/device_session.hpp"
#include "input_module/hidapi_transport.hpp"
#include "input_module/logging_transport.hpp"

namespace fw::iom {

DeviceBus::DeviceBus(std::unique_ptr<DeviceRegistry> registry,
                     std::unique_ptr<TransportFactory> transports,
                     SignatureTable signatures)
    : registry_(std::move(registry)),
      transports_(std::move(transports)),
      signatures_(std::move(signatures)) {
    if (!registry_ || !transports_) {
        throw std::invalid_argument("DeviceBus requires a registry and a transport factory");
    }
}

DeviceBus::~DeviceBus() = default;

std::vector<DeviceDescriptor> DeviceBus::discover() const {
    return fw::iom::discover(*registry_, signatures_);
}

std::vector<DeviceDescriptor> DeviceBus::discover(DeviceKind kind) const {
    auto found = discover();
    found.erase(std::remove_if(found.begin(), found.end(),
                               [kind](const DeviceDescriptor& d) { return d.kind() != kind; }),
                found.end());
    return found;
}

expected<std::unique_ptr<DeviceSession>> DeviceBus::openSession(const DeviceDescriptor& descriptor,
                                                                RetryPolicy policy) {
    return DeviceSession::open(*this, descriptor, std::move(policy));
}

std::unique_ptr<DeviceBus> makeBus(const std::string& transport_id, SignatureTable signatures) {
    if (transport_id == "hidapi") {
        auto context = std::make_shared<HidapiContext>();
        return std::make_unique<DeviceBus>(std::make_unique<HidapiRegistry>(context),
                                           std::make_unique<HidapiTransportFactory>(context),
                                           std::move(signatures));
    }
    if (transport_id == "logging") {
        return std::make_unique<DeviceBus>(std::make_unique<LoggingRegistry>(),
                                           std::make_unique<LoggingTransportFactory>(),
                                           std::move(signatures));
    }
    throw std::runtime_error("Unsupported transport: " + transport_id);
}

}  // namespace fw::iom
