#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "input_module/device_registry.hpp"
#include "input_module/device_transport.hpp"

namespace fw::iom {

// Dry-run transport: dumps every packet to stdout and answers reads with a
// zeroed report.
class LoggingTransport : public DeviceTransport {
public:
    explicit LoggingTransport(std::string path);

    std::string id() const override;
    expected<void> write(const std::vector<std::uint8_t>& bytes,
                         std::chrono::milliseconds timeout) override;
    expected<std::size_t> read(std::vector<std::uint8_t>& buffer,
                               std::chrono::milliseconds timeout) override;
    void close() noexcept override;
    bool isOpen() const noexcept override;

private:
    std::string path_;
    mutable std::mutex mutex_;
    bool open_{true};
};

class LoggingTransportFactory : public TransportFactory {
public:
    std::string id() const override;
    expected<std::unique_ptr<DeviceTransport>> open(const DeviceDescriptor& descriptor) override;
};

// Reports `count` LED matrices at paths "logging:0", "logging:1", ...
class LoggingRegistry : public DeviceRegistry {
public:
    explicit LoggingRegistry(std::size_t count = 2);

    std::string id() const override;
    std::vector<RegistryEntry> enumerate() override;

private:
    std::size_t count_;
};

}  // namespace fw::iom
