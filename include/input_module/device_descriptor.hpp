#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "input_module/types.hpp"

namespace fw::iom {

// Identity of one discovered module. Equality and hashing use the transport
// path only, so successive discovery scans can be diffed.
class DeviceDescriptor {
public:
    DeviceDescriptor(std::uint16_t vendor_id,
                     std::uint16_t product_id,
                     std::string path,
                     DeviceKind kind,
                     std::string name = {},
                     std::string serial = {});

    [[nodiscard]] std::uint16_t vendorId() const noexcept { return vendor_id_; }
    [[nodiscard]] std::uint16_t productId() const noexcept { return product_id_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] DeviceKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& serial() const noexcept { return serial_; }

    // "LED Matrix (32ac:0020) at /dev/hidraw3"
    [[nodiscard]] std::string describe() const;

private:
    std::uint16_t vendor_id_;
    std::uint16_t product_id_;
    std::string path_;
    DeviceKind kind_;
    std::string name_;
    std::string serial_;
};

inline bool operator==(const DeviceDescriptor& lhs, const DeviceDescriptor& rhs) {
    return lhs.path() == rhs.path();
}

inline bool operator!=(const DeviceDescriptor& lhs, const DeviceDescriptor& rhs) {
    return !(lhs == rhs);
}

inline bool operator<(const DeviceDescriptor& lhs, const DeviceDescriptor& rhs) {
    return lhs.path() < rhs.path();
}

}  // namespace fw::iom

namespace std {

template <>
struct hash<fw::iom::DeviceDescriptor> {
    std::size_t operator()(const fw::iom::DeviceDescriptor& descriptor) const noexcept {
        return std::hash<std::string>{}(descriptor.path());
    }
};

}  // namespace std
