#include "input_module/frame_codec.hpp"

#include <algorithm>
#include <initializer_list>
#include <utility>

#include "input_module/errors.hpp"

namespace fw::iom {

namespace {

using wire::Command;
using wire::KindLayout;
using wire::Packing;
using wire::PacketView;

std::uint8_t clampIntensity(int value, int max_value) {
    return static_cast<std::uint8_t>(std::clamp(value, 0, max_value));
}

// Per-packing encode/decode pair. No state is shared between strategies.
using EncodeFn = CommandFrame (*)(const PixelMatrix&, const KindLayout&);
using DecodeFn = expected<PixelMatrix> (*)(const CommandFrame&, const KindLayout&);

struct PackingStrategy {
    Packing packing;
    Command lead;  // command of the first packet, used to recognize a frame
    EncodeFn encode;
    DecodeFn decode;
};

// One StageColumn per column, then DrawBuffer to commit them.
CommandFrame encodeGreyscaleColumns(const PixelMatrix& matrix, const KindLayout& layout) {
    CommandFrame frame;
    frame.packets.reserve(layout.width + 1);
    for (std::size_t x = 0; x < layout.width; ++x) {
        std::vector<std::uint8_t> payload;
        payload.reserve(layout.height + 1);
        payload.push_back(static_cast<std::uint8_t>(x));
        for (std::size_t y = 0; y < layout.height; ++y) {
            payload.push_back(clampIntensity(matrix.at(x, y), layout.max_intensity));
        }
        frame.packets.push_back(wire::makePacket(Command::StageColumn, payload));
    }
    frame.packets.push_back(wire::makePacket(Command::DrawBuffer));
    return frame;
}

expected<PixelMatrix> decodeGreyscaleColumns(const CommandFrame& frame, const KindLayout& layout) {
    if (frame.packets.size() != layout.width + 1) {
        return unexpected(make_error_code(DecodeError::Malformed));
    }

    PixelMatrix matrix(layout.width, layout.height);
    PacketView view{};
    for (std::size_t x = 0; x < layout.width; ++x) {
        if (!wire::parsePacket(frame.packets[x], view) ||
            view.query ||
            view.command != Command::StageColumn ||
            view.payload[0] != x) {
            return unexpected(make_error_code(DecodeError::Malformed));
        }
        for (std::size_t y = 0; y < layout.height; ++y) {
            matrix.set(x, y, view.payload[y + 1]);
        }
    }

    if (!wire::parsePacket(frame.packets.back(), view) || view.query ||
        view.command != Command::DrawBuffer) {
        return unexpected(make_error_code(DecodeError::Malformed));
    }
    return matrix;
}

// One bit per cell at location x * height + y, least significant bit first.
// Any non-zero intensity lights the cell.
CommandFrame encodeMonochromeColumns(const PixelMatrix& matrix, const KindLayout& layout) {
    std::vector<std::uint8_t> payload((layout.width * layout.height + 7) / 8, 0);
    for (std::size_t x = 0; x < layout.width; ++x) {
        for (std::size_t y = 0; y < layout.height; ++y) {
            if (clampIntensity(matrix.at(x, y), layout.max_intensity) == 0) {
                continue;
            }
            const auto location = x * layout.height + y;
            payload[location / 8] |= static_cast<std::uint8_t>(1u << (location % 8));
        }
    }

    CommandFrame frame;
    frame.packets.push_back(wire::makePacket(Command::Draw, payload));
    return frame;
}

expected<PixelMatrix> decodeMonochromeColumns(const CommandFrame& frame, const KindLayout& layout) {
    PacketView view{};
    if (frame.packets.size() != 1 ||
        !wire::parsePacket(frame.packets.front(), view) ||
        view.query ||
        view.command != Command::Draw) {
        return unexpected(make_error_code(DecodeError::Malformed));
    }

    PixelMatrix matrix(layout.width, layout.height);
    for (std::size_t x = 0; x < layout.width; ++x) {
        for (std::size_t y = 0; y < layout.height; ++y) {
            const auto location = x * layout.height + y;
            const bool lit = (view.payload[location / 8] >> (location % 8)) & 0x01;
            matrix.set(x, y, lit ? layout.max_intensity : 0);
        }
    }
    return matrix;
}

constexpr PackingStrategy kStrategies[] = {
    {Packing::GreyscaleColumns, Command::StageColumn, &encodeGreyscaleColumns, &decodeGreyscaleColumns},
    {Packing::MonochromeColumns, Command::Draw, &encodeMonochromeColumns, &decodeMonochromeColumns},
};

const PackingStrategy* strategyFor(Packing packing) noexcept {
    for (const auto& strategy : kStrategies) {
        if (strategy.packing == packing) {
            return &strategy;
        }
    }
    return nullptr;
}

expected<CommandFrame> encodeWith(Packing packing, const PixelMatrix& matrix, DeviceKind kind) {
    const auto& layout = wire::layoutFor(kind);
    const auto* strategy = strategyFor(packing);
    if (strategy == nullptr) {
        return unexpected(make_error_code(EncodeError::UnsupportedKind));
    }
    if (matrix.width() != layout.width || matrix.height() != layout.height) {
        return unexpected(make_error_code(EncodeError::DimensionMismatch));
    }
    return strategy->encode(matrix, layout);
}

CommandFrame singlePacket(wire::Packet packet) {
    CommandFrame frame;
    frame.packets.push_back(std::move(packet));
    return frame;
}

}  // namespace

expected<CommandFrame> encodeFrame(const PixelMatrix& matrix, DeviceKind kind) {
    return encodeWith(wire::layoutFor(kind).packing, matrix, kind);
}

expected<CommandFrame> encodeMonochromeFrame(const PixelMatrix& matrix, DeviceKind kind) {
    return encodeWith(wire::layoutFor(kind).mono_packing, matrix, kind);
}

expected<PixelMatrix> decodeFrame(const CommandFrame& frame, DeviceKind kind) {
    const auto& layout = wire::layoutFor(kind);
    if (layout.packing == Packing::None) {
        return unexpected(make_error_code(EncodeError::UnsupportedKind));
    }

    PacketView view{};
    if (frame.packets.empty() || !wire::parsePacket(frame.packets.front(), view)) {
        return unexpected(make_error_code(DecodeError::Malformed));
    }
    for (auto packing : {layout.packing, layout.mono_packing}) {
        const auto* strategy = strategyFor(packing);
        if (strategy != nullptr && strategy->lead == view.command) {
            return strategy->decode(frame, layout);
        }
    }
    return unexpected(make_error_code(DecodeError::Malformed));
}

expected<CommandFrame> encodeBrightness(int level, DeviceKind kind) {
    const auto& layout = wire::layoutFor(kind);
    if (layout.max_brightness <= 0) {
        return unexpected(make_error_code(EncodeError::UnsupportedKind));
    }
    if (level < 0 || level > layout.max_brightness) {
        return unexpected(make_error_code(EncodeError::OutOfRange));
    }
    return singlePacket(wire::makePacket(Command::Brightness, {static_cast<std::uint8_t>(level)}));
}

expected<CommandFrame> encodePattern(const Pattern& pattern, DeviceKind kind) {
    if (!wire::layoutFor(kind).supports_patterns) {
        return unexpected(make_error_code(EncodeError::UnsupportedKind));
    }

    std::uint8_t argument = 0;
    switch (pattern.id) {
        case PatternId::Percentage:
            if (pattern.percentage < 0 || pattern.percentage > 100) {
                return unexpected(make_error_code(EncodeError::OutOfRange));
            }
            argument = static_cast<std::uint8_t>(pattern.percentage);
            break;
        case PatternId::Gradient:
        case PatternId::DoubleGradient:
        case PatternId::DisplayLotus:
        case PatternId::ZigZag:
        case PatternId::FullBrightness:
        case PatternId::DisplayPanic:
        case PatternId::DisplayLotus2:
            break;
        default:
            return unexpected(make_error_code(EncodeError::OutOfRange));
    }

    return singlePacket(wire::makePacket(Command::Pattern,
                                         {static_cast<std::uint8_t>(pattern.id), argument}));
}

expected<CommandFrame> encodeSleep(bool sleeping, DeviceKind kind) {
    if (!wire::layoutFor(kind).supports_sleep) {
        return unexpected(make_error_code(EncodeError::UnsupportedKind));
    }
    return singlePacket(wire::makePacket(Command::Sleep, {static_cast<std::uint8_t>(sleeping ? 1 : 0)}));
}

expected<CommandFrame> encodeAnimation(bool animate, DeviceKind kind) {
    if (!wire::layoutFor(kind).supports_patterns) {
        return unexpected(make_error_code(EncodeError::UnsupportedKind));
    }
    return singlePacket(wire::makePacket(Command::Animate, {static_cast<std::uint8_t>(animate ? 1 : 0)}));
}

expected<CommandFrame> encodeStatusQuery(DeviceKind kind) {
    if (!wire::layoutFor(kind).supports_status) {
        return unexpected(make_error_code(EncodeError::UnsupportedKind));
    }

    CommandFrame frame;
    frame.packets.push_back(wire::makeQuery(Command::Brightness));
    frame.packets.push_back(wire::makeQuery(Command::Sleep));
    frame.packets.push_back(wire::makeQuery(Command::Version));
    return frame;
}

expected<DeviceStatus> decodeStatus(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() != 3 * wire::kResponseLength) {
        return unexpected(make_error_code(DecodeError::Malformed));
    }

    const auto* brightness = bytes.data();
    const auto* sleep = brightness + wire::kResponseLength;
    const auto* version = sleep + wire::kResponseLength;

    if (sleep[0] > 1 || version[2] > 1) {
        return unexpected(make_error_code(DecodeError::Malformed));
    }

    DeviceStatus status;
    status.brightness = brightness[0];
    status.sleeping = sleep[0] == 1;
    status.firmware.major = version[0];
    status.firmware.minor = static_cast<std::uint8_t>(version[1] >> 4);
    status.firmware.patch = static_cast<std::uint8_t>(version[1] & 0x0F);
    status.firmware.prerelease = version[2] == 1;
    return status;
}

expected<std::vector<std::uint8_t>> encodeStatus(const DeviceStatus& status) {
    // minor and patch share one byte on the wire.
    if (status.firmware.minor > 0x0F || status.firmware.patch > 0x0F) {
        return unexpected(make_error_code(EncodeError::OutOfRange));
    }

    std::vector<std::uint8_t> bytes(3 * wire::kResponseLength, 0);
    auto* brightness = bytes.data();
    auto* sleep = brightness + wire::kResponseLength;
    auto* version = sleep + wire::kResponseLength;

    brightness[0] = status.brightness;
    sleep[0] = status.sleeping ? 1 : 0;
    version[0] = status.firmware.major;
    version[1] = static_cast<std::uint8_t>((status.firmware.minor << 4) | status.firmware.patch);
    version[2] = status.firmware.prerelease ? 1 : 0;
    return bytes;
}

PixelMatrix blankMatrix(DeviceKind kind, int value) {
    const auto& layout = wire::layoutFor(kind);
    return PixelMatrix(layout.width, layout.height, value);
}

}  // namespace fw::iom
