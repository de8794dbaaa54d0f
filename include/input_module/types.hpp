#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace fw::iom {

enum class DeviceKind : std::uint8_t {
    LedMatrix,
    KeyboardBacklight,
    Other,
};

[[nodiscard]] const char* toString(DeviceKind kind) noexcept;
[[nodiscard]] std::optional<DeviceKind> parseDeviceKind(const std::string& text);

struct FirmwareVersion {
    std::uint8_t major{0};
    std::uint8_t minor{0};
    std::uint8_t patch{0};
    bool prerelease{false};
};

struct DeviceStatus {
    std::uint8_t brightness{0};
    bool sleeping{false};
    FirmwareVersion firmware;
};

inline bool operator==(const FirmwareVersion& lhs, const FirmwareVersion& rhs) {
    return lhs.major == rhs.major && lhs.minor == rhs.minor &&
           lhs.patch == rhs.patch && lhs.prerelease == rhs.prerelease;
}

inline bool operator!=(const FirmwareVersion& lhs, const FirmwareVersion& rhs) {
    return !(lhs == rhs);
}

inline bool operator==(const DeviceStatus& lhs, const DeviceStatus& rhs) {
    return lhs.brightness == rhs.brightness && lhs.sleeping == rhs.sleeping &&
           lhs.firmware == rhs.firmware;
}

inline bool operator!=(const DeviceStatus& lhs, const DeviceStatus& rhs) {
    return !(lhs == rhs);
}

// Built-in animations stored in the module firmware.
enum class PatternId : std::uint8_t {
    Percentage = 0x00,
    Gradient = 0x01,
    DoubleGradient = 0x02,
    DisplayLotus = 0x03,
    ZigZag = 0x04,
    FullBrightness = 0x05,
    DisplayPanic = 0x06,
    DisplayLotus2 = 0x07,
};

struct Pattern {
    PatternId id{PatternId::Gradient};
    int percentage{0};  // only read for PatternId::Percentage

    static Pattern percent(int value) { return Pattern{PatternId::Percentage, value}; }
};

}  // namespace fw::iom
