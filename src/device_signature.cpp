#include "input_module/device_signature.hpp"

#include <utility>

namespace fw::iom {

namespace {

// QMK raw HID interface exposed by the keyboard-class modules.
constexpr std::uint16_t kRawHidUsagePage = 0xFF60;
constexpr std::uint16_t kRawHidUsage = 0x0061;

std::vector<DeviceSignature> frameworkModules() {
    return {
        {"LED Matrix", kFrameworkVendorId, 0x0020, DeviceKind::LedMatrix, std::nullopt, std::nullopt},
        {"Keyboard ANSI", kFrameworkVendorId, 0x0012, DeviceKind::KeyboardBacklight, kRawHidUsagePage, kRawHidUsage},
        {"Keyboard ISO", kFrameworkVendorId, 0x0018, DeviceKind::KeyboardBacklight, kRawHidUsagePage, kRawHidUsage},
        {"Keyboard JIS", kFrameworkVendorId, 0x0019, DeviceKind::KeyboardBacklight, kRawHidUsagePage, kRawHidUsage},
        {"Macropad", kFrameworkVendorId, 0x0013, DeviceKind::Other, kRawHidUsagePage, kRawHidUsage},
        {"Numpad", kFrameworkVendorId, 0x0014, DeviceKind::Other, kRawHidUsagePage, kRawHidUsage},
        {"B1 Display", kFrameworkVendorId, 0x0021, DeviceKind::Other, std::nullopt, std::nullopt},
        {"C1 Minimal", kFrameworkVendorId, 0x0022, DeviceKind::Other, std::nullopt, std::nullopt},
    };
}

}  // namespace

bool DeviceSignature::matches(const RegistryEntry& entry) const noexcept {
    if (entry.vendor_id != vendor_id || entry.product_id != product_id) {
        return false;
    }

    // Backends that do not report usages (usage_page == 0) match on ids alone.
    if (entry.usage_page == 0) {
        return true;
    }
    if (usage_page.has_value() && entry.usage_page != usage_page.value()) {
        return false;
    }
    if (usage.has_value() && entry.usage != usage.value()) {
        return false;
    }
    return true;
}

SignatureTable::SignatureTable(std::vector<DeviceSignature> entries)
    : entries_(std::move(entries)) {}

const DeviceSignature* SignatureTable::match(const RegistryEntry& entry) const noexcept {
    for (const auto& signature : entries_) {
        if (signature.matches(entry)) {
            return &signature;
        }
    }
    return nullptr;
}

SignatureTable SignatureTable::withAdditional(const std::vector<DeviceSignature>& extra) const {
    auto combined = entries_;
    combined.insert(combined.end(), extra.begin(), extra.end());
    return SignatureTable(std::move(combined));
}

const SignatureTable& SignatureTable::builtin() {
    static const SignatureTable table(frameworkModules());
    return table;
}

}  // namespace fw::iom
