#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "input_module/device_registry.hpp"
#include "input_module/device_transport.hpp"
#include "input_module/errors.hpp"

namespace fw::iom::test {

// Behaviour shared by every transport a SimulatedFactory hands out, so a
// script survives reopens.
struct SimScript {
    // One entry per write attempt; an empty error_code means success. Writes
    // past the end of the queue succeed.
    std::deque<std::error_code> write_results;
    // One entry per read; same convention. A failed read consumes no response.
    std::deque<std::error_code> read_results;
    // One entry per open; same convention.
    std::deque<std::error_code> open_results;
    // Served to reads in order, wrapping around.
    std::vector<std::uint8_t> responses;

    std::vector<std::vector<std::uint8_t>> written;  // successful writes only
    std::size_t write_attempts{0};
    std::size_t opens{0};
    std::size_t response_offset{0};
};

class SimulatedTransport : public DeviceTransport {
public:
    explicit SimulatedTransport(std::shared_ptr<SimScript> script)
        : script_(std::move(script)) {}

    std::string id() const override { return "sim"; }

    expected<void> write(const std::vector<std::uint8_t>& bytes,
                         std::chrono::milliseconds /*timeout*/) override {
        if (!open_) {
            return unexpected(make_error_code(WriteError::Disconnected));
        }
        ++script_->write_attempts;
        if (!script_->write_results.empty()) {
            const auto result = script_->write_results.front();
            script_->write_results.pop_front();
            if (result) {
                return unexpected(result);
            }
        }
        script_->written.push_back(bytes);
        return {};
    }

    expected<std::size_t> read(std::vector<std::uint8_t>& buffer,
                               std::chrono::milliseconds /*timeout*/) override {
        if (!open_) {
            return unexpected(make_error_code(ReadError::Disconnected));
        }
        if (!script_->read_results.empty()) {
            const auto result = script_->read_results.front();
            script_->read_results.pop_front();
            if (result) {
                return unexpected(result);
            }
        }
        auto& source = script_->responses;
        for (auto& byte : buffer) {
            byte = source.empty() ? 0 : source[script_->response_offset++ % source.size()];
        }
        return buffer.size();
    }

    void close() noexcept override { open_ = false; }
    bool isOpen() const noexcept override { return open_; }

private:
    std::shared_ptr<SimScript> script_;
    bool open_{true};
};

class SimulatedFactory : public TransportFactory {
public:
    explicit SimulatedFactory(std::shared_ptr<SimScript> script = std::make_shared<SimScript>())
        : script_(std::move(script)) {}

    std::string id() const override { return "sim"; }

    expected<std::unique_ptr<DeviceTransport>> open(const DeviceDescriptor& /*descriptor*/) override {
        ++script_->opens;
        if (!script_->open_results.empty()) {
            const auto result = script_->open_results.front();
            script_->open_results.pop_front();
            if (result) {
                return unexpected(result);
            }
        }
        return std::make_unique<SimulatedTransport>(script_);
    }

    SimScript& script() { return *script_; }

private:
    std::shared_ptr<SimScript> script_;
};

class SimulatedRegistry : public DeviceRegistry {
public:
    explicit SimulatedRegistry(std::vector<RegistryEntry> entries = {})
        : entries_(std::move(entries)) {}

    std::string id() const override { return "sim"; }
    std::vector<RegistryEntry> enumerate() override { return entries_; }

private:
    std::vector<RegistryEntry> entries_;
};

inline RegistryEntry makeEntry(std::uint16_t vendor_id,
                               std::uint16_t product_id,
                               std::string path,
                               std::uint16_t usage_page = 0,
                               std::uint16_t usage = 0) {
    RegistryEntry entry;
    entry.vendor_id = vendor_id;
    entry.product_id = product_id;
    entry.path = std::move(path);
    entry.usage_page = usage_page;
    entry.usage = usage;
    return entry;
}

}  // namespace fw::iom::test
