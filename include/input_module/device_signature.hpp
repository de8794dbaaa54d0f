#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "input_module/device_registry.hpp"
#include "input_module/types.hpp"

namespace fw::iom {

inline constexpr std::uint16_t kFrameworkVendorId = 0x32AC;

struct DeviceSignature {
    std::string name;
    std::uint16_t vendor_id{0};
    std::uint16_t product_id{0};
    DeviceKind kind{DeviceKind::Other};
    std::optional<std::uint16_t> usage_page;
    std::optional<std::uint16_t> usage;

    [[nodiscard]] bool matches(const RegistryEntry& entry) const noexcept;
};

// Immutable list of known vendor/product signatures. Later entries never
// override earlier ones; the first match wins.
class SignatureTable {
public:
    explicit SignatureTable(std::vector<DeviceSignature> entries);

    [[nodiscard]] const DeviceSignature* match(const RegistryEntry& entry) const noexcept;
    [[nodiscard]] const std::vector<DeviceSignature>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] SignatureTable withAdditional(const std::vector<DeviceSignature>& extra) const;

    // Framework input modules; built on first use and never modified.
    [[nodiscard]] static const SignatureTable& builtin();

private:
    std::vector<DeviceSignature> entries_;
};

}  // namespace fw::iom
