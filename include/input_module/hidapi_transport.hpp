#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <hidapi/hidapi.h>

#include "input_module/device_registry.hpp"
#include "input_module/device_transport.hpp"

namespace fw::iom {

// Owns hid_init/hid_exit. Shared by the registry, the factory and every open
// transport so the library stays initialized while any of them is alive.
class HidapiContext {
public:
    HidapiContext();
    ~HidapiContext();

    HidapiContext(const HidapiContext&) = delete;
    HidapiContext& operator=(const HidapiContext&) = delete;

    [[nodiscard]] bool initialized() const noexcept { return initialized_; }

private:
    bool initialized_{false};
};

using HidapiContextPtr = std::shared_ptr<HidapiContext>;

class HidapiTransport : public DeviceTransport {
public:
    HidapiTransport(HidapiContextPtr context, hid_device* device, std::string path);
    ~HidapiTransport() override;

    std::string id() const override;
    expected<void> write(const std::vector<std::uint8_t>& bytes,
                         std::chrono::milliseconds timeout) override;
    expected<std::size_t> read(std::vector<std::uint8_t>& buffer,
                               std::chrono::milliseconds timeout) override;
    void close() noexcept override;
    bool isOpen() const noexcept override;

private:
    struct HidDeleter {
        void operator()(hid_device* device) const noexcept;
    };

    HidapiContextPtr context_;
    std::string path_;
    mutable std::mutex mutex_;
    std::unique_ptr<hid_device, HidDeleter> handle_;
};

class HidapiTransportFactory : public TransportFactory {
public:
    explicit HidapiTransportFactory(HidapiContextPtr context);

    std::string id() const override;
    expected<std::unique_ptr<DeviceTransport>> open(const DeviceDescriptor& descriptor) override;

private:
    HidapiContextPtr context_;
};

class HidapiRegistry : public DeviceRegistry {
public:
    explicit HidapiRegistry(HidapiContextPtr context);

    std::string id() const override;
    std::vector<RegistryEntry> enumerate() override;

private:
    HidapiContextPtr context_;
};

}  // namespace fw::iom
