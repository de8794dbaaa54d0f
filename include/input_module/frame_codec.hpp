#pragma once

#include <cstdint>
#include <vector>

#include "input_module/expected.hpp"
#include "input_module/pixel_matrix.hpp"
#include "input_module/types.hpp"
#include "input_module/wire_protocol.hpp"

namespace fw::iom {

// Ordered packets making up one logical command. Regenerated per call.
struct CommandFrame {
    std::vector<wire::Packet> packets;
};

// Pure conversions between application values and wire packets. The packing
// used for a matrix is selected by the device kind's layout row.

// Values outside [0, max_intensity] are clamped. Fails with
// EncodeError::DimensionMismatch when the shape differs from the kind's grid and
// EncodeError::UnsupportedKind for kinds without a frame packing.
[[nodiscard]] expected<CommandFrame> encodeFrame(const PixelMatrix& matrix, DeviceKind kind);

// One bit per cell in a single Draw packet: any non-zero intensity is lit.
// Same failures as encodeFrame.
[[nodiscard]] expected<CommandFrame> encodeMonochromeFrame(const PixelMatrix& matrix, DeviceKind kind);

// Inverse of encodeFrame and encodeMonochromeFrame, chosen by the first packet's
// command. Greyscale frames yield the clamped matrix; monochrome frames yield
// max_intensity for lit cells.
[[nodiscard]] expected<PixelMatrix> decodeFrame(const CommandFrame& frame, DeviceKind kind);

// Levels outside the kind's brightness scale fail with EncodeError::OutOfRange.
[[nodiscard]] expected<CommandFrame> encodeBrightness(int level, DeviceKind kind);

[[nodiscard]] expected<CommandFrame> encodePattern(const Pattern& pattern, DeviceKind kind);
[[nodiscard]] expected<CommandFrame> encodeSleep(bool sleeping, DeviceKind kind);
[[nodiscard]] expected<CommandFrame> encodeAnimation(bool animate, DeviceKind kind);

// Brightness, sleep and version queries; each packet expects one response.
[[nodiscard]] expected<CommandFrame> encodeStatusQuery(DeviceKind kind);

// Parses the concatenated responses to encodeStatusQuery.
[[nodiscard]] expected<DeviceStatus> decodeStatus(const std::vector<std::uint8_t>& bytes);

// Device side of decodeStatus: the response block a module returns for status.
// Minor or patch above 15 fails with EncodeError::OutOfRange.
[[nodiscard]] expected<std::vector<std::uint8_t>> encodeStatus(const DeviceStatus& status);

// Matrix of the kind's grid size filled with value.
[[nodiscard]] PixelMatrix blankMatrix(DeviceKind kind, int value = 0);

}  // namespace fw::iom
