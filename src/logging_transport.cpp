#include "input_module/logging_transport.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

#include "input_module/device_signature.hpp"
#include "input_module/errors.hpp"

namespace fw::iom {

LoggingTransport::LoggingTransport(std::string path)
    : path_(std::move(path)) {}

std::string LoggingTransport::id() const {
    return "logging";
}

expected<void> LoggingTransport::write(const std::vector<std::uint8_t>& bytes,
                                       std::chrono::milliseconds /*timeout*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return unexpected(make_error_code(WriteError::Disconnected));
    }

    std::cout << "[LoggingTransport] " << path_ << " <- " << bytes.size() << " bytes:" << '\n';
    std::cout << std::hex << std::setfill('0');
    std::size_t column = 0;
    for (auto byte : bytes) {
        std::cout << "0x" << std::setw(2) << static_cast<int>(byte) << ' ';
        if (++column == 16) {
            std::cout << '\n';
            column = 0;
        }
    }
    if (column != 0) {
        std::cout << '\n';
    }
    std::cout << std::dec << std::setfill(' ');
    return {};
}

expected<std::size_t> LoggingTransport::read(std::vector<std::uint8_t>& buffer,
                                             std::chrono::milliseconds /*timeout*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return unexpected(make_error_code(ReadError::Disconnected));
    }
    std::fill(buffer.begin(), buffer.end(), 0);
    return buffer.size();
}

void LoggingTransport::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
}

bool LoggingTransport::isOpen() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::string LoggingTransportFactory::id() const {
    return "logging";
}

expected<std::unique_ptr<DeviceTransport>> LoggingTransportFactory::open(const DeviceDescriptor& descriptor) {
    std::cout << "[LoggingTransport] Connected to " << descriptor.describe() << '\n';
    return std::make_unique<LoggingTransport>(descriptor.path());
}

LoggingRegistry::LoggingRegistry(std::size_t count)
    : count_(count) {}

std::string LoggingRegistry::id() const {
    return "logging";
}

std::vector<RegistryEntry> LoggingRegistry::enumerate() {
    std::vector<RegistryEntry> entries;
    entries.reserve(count_);
    for (std::size_t i = 0; i < count_; ++i) {
        RegistryEntry entry;
        entry.vendor_id = kFrameworkVendorId;
        entry.product_id = 0x0020;
        entry.path = "logging:" + std::to_string(i);
        entry.product = "LED Matrix";
        entries.push_back(std::move(entry));
    }
    return entries;
}

}  // namespace fw::iom
