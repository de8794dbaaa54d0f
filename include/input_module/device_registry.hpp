#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fw::iom {

// One interface as reported by the operating system's device registry.
struct RegistryEntry {
    std::uint16_t vendor_id{0};
    std::uint16_t product_id{0};
    std::string path;
    std::string serial;
    std::string product;
    std::uint16_t usage_page{0};  // 0 when the backend does not report usages
    std::uint16_t usage{0};
    int interface_number{-1};
};

class DeviceRegistry {
public:
    virtual ~DeviceRegistry() = default;

    virtual std::string id() const = 0;
    // Snapshot of attached interfaces; empty when enumeration is unavailable.
    virtual std::vector<RegistryEntry> enumerate() = 0;
};

}  // namespace fw::iom
