#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "input_module/types.hpp"

namespace fw::iom::wire {

// Setter reports: [report id][magic][magic][command][arguments...] zero padded
// to kPacketLength. Queries are the bare header, unpadded, so a query never
// looks like a setter whose argument is zero.
inline constexpr std::uint8_t kReportId = 0x00;
inline constexpr std::array<std::uint8_t, 2> kMagic{0x32, 0xAC};
inline constexpr std::size_t kHeaderLength = 4;
inline constexpr std::size_t kPacketLength = 65;
inline constexpr std::size_t kMaxPayloadLength = kPacketLength - kHeaderLength;
inline constexpr std::size_t kQueryLength = kHeaderLength;
inline constexpr std::size_t kResponseLength = 32;

enum class Command : std::uint8_t {
    Brightness = 0x00,
    Pattern = 0x01,
    Sleep = 0x03,
    Animate = 0x04,
    Draw = 0x06,
    StageColumn = 0x07,
    DrawBuffer = 0x08,
    Version = 0x20,
};

enum class Packing : std::uint8_t {
    None,
    GreyscaleColumns,   // one StageColumn per column, then DrawBuffer
    MonochromeColumns,  // one Draw with a column-major bitmap, LSB first
};

struct KindLayout {
    DeviceKind kind;
    std::size_t width;
    std::size_t height;
    int max_intensity;
    int max_brightness;
    Packing packing;       // used by encodeFrame
    Packing mono_packing;  // used by encodeMonochromeFrame
    bool supports_status;
    bool supports_sleep;
    bool supports_patterns;
};

// One row per device kind; never mutated.
[[nodiscard]] const KindLayout& layoutFor(DeviceKind kind) noexcept;

struct Packet {
    std::vector<std::uint8_t> bytes;
    std::size_t response_length{0};
};

// Throws std::length_error when the arguments exceed kMaxPayloadLength.
[[nodiscard]] Packet makePacket(Command command, const std::vector<std::uint8_t>& arguments = {});

// Unpadded query expecting one kResponseLength response.
[[nodiscard]] Packet makeQuery(Command command);

// Validates the framing of a packet and reports its command and arguments.
// Queries have no arguments; a setter's payload spans kMaxPayloadLength bytes.
struct PacketView {
    Command command;
    const std::uint8_t* payload;
    bool query;
};

[[nodiscard]] bool parsePacket(const Packet& packet, PacketView& view) noexcept;

}  // namespace fw::iom::wire
