#include "input_module/types.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace fw::iom {

const char* toString(DeviceKind kind) noexcept {
    switch (kind) {
        case DeviceKind::LedMatrix:
            return "led_matrix";
        case DeviceKind::KeyboardBacklight:
            return "keyboard_backlight";
        case DeviceKind::Other:
            return "other";
    }
    return "other";
}

std::optional<DeviceKind> parseDeviceKind(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(lower), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (lower == "led_matrix") return DeviceKind::LedMatrix;
    if (lower == "keyboard_backlight") return DeviceKind::KeyboardBacklight;
    if (lower == "other") return DeviceKind::Other;
    return std::nullopt;
}

}  // namespace fw::iom
