#include "input_module/wire_protocol.hpp"

#include <stdexcept>

namespace fw::iom::wire {

namespace {

// Keyboards speak QMK raw HID, not the LED matrix command set; they are
// discovered but every command on them fails with UnsupportedKind.
constexpr std::array<KindLayout, 3> kLayouts{{
    {DeviceKind::LedMatrix, 9, 34, 255, 255, Packing::GreyscaleColumns, Packing::MonochromeColumns, true, true, true},
    {DeviceKind::KeyboardBacklight, 0, 0, 0, 0, Packing::None, Packing::None, false, false, false},
    {DeviceKind::Other, 0, 0, 0, 0, Packing::None, Packing::None, false, false, false},
}};

std::vector<std::uint8_t> header(Command command) {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(kPacketLength);
    bytes.push_back(kReportId);
    bytes.insert(bytes.end(), kMagic.begin(), kMagic.end());
    bytes.push_back(static_cast<std::uint8_t>(command));
    return bytes;
}

}  // namespace

const KindLayout& layoutFor(DeviceKind kind) noexcept {
    for (const auto& layout : kLayouts) {
        if (layout.kind == kind) {
            return layout;
        }
    }
    return kLayouts.back();
}

Packet makePacket(Command command, const std::vector<std::uint8_t>& arguments) {
    if (arguments.size() > kMaxPayloadLength) {
        throw std::length_error("Payload exceeds packet length");
    }

    Packet packet;
    packet.bytes = header(command);
    packet.bytes.insert(packet.bytes.end(), arguments.begin(), arguments.end());
    packet.bytes.resize(kPacketLength, 0);
    return packet;
}

Packet makeQuery(Command command) {
    Packet packet;
    packet.bytes = header(command);
    packet.response_length = kResponseLength;
    return packet;
}

bool parsePacket(const Packet& packet, PacketView& view) noexcept {
    const auto& bytes = packet.bytes;
    if (bytes.size() != kPacketLength && bytes.size() != kQueryLength) {
        return false;
    }
    if (bytes[0] != kReportId || bytes[1] != kMagic[0] || bytes[2] != kMagic[1]) {
        return false;
    }

    view.command = static_cast<Command>(bytes[3]);
    view.payload = bytes.data() + kHeaderLength;
    view.query = bytes.size() == kQueryLength;
    return true;
}

}  // namespace fw::iom::wire
