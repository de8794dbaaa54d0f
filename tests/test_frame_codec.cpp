#include "input_module/errors.hpp"
#include "input_module/frame_codec.hpp"

#include <cstdint>
#include <utility>
#include <vector>

#include "test_support.hpp"

using namespace fw::iom;

static void testLedMatrixFrame() {
    auto matrix = blankMatrix(DeviceKind::LedMatrix);
    matrix.set(0, 0, 17);
    matrix.set(8, 33, 200);

    auto frame = encodeFrame(matrix, DeviceKind::LedMatrix);
    ASSERT_TRUE(frame.has_value(), "9x34 matrix encodes");
    if (!frame) {
        return;
    }
    ASSERT_EQ(frame->packets.size(), static_cast<std::size_t>(10), "nine columns plus commit");

    const auto& first = frame->packets.front().bytes;
    ASSERT_EQ(first.size(), wire::kPacketLength, "packets are padded to the report length");
    ASSERT_EQ(first[0], wire::kReportId, "report id");
    ASSERT_EQ(first[1], static_cast<std::uint8_t>(0x32), "magic byte 0");
    ASSERT_EQ(first[2], static_cast<std::uint8_t>(0xAC), "magic byte 1");
    ASSERT_EQ(first[3], static_cast<std::uint8_t>(wire::Command::StageColumn), "stage column command");
    ASSERT_EQ(first[4], static_cast<std::uint8_t>(0), "column index follows the command");
    ASSERT_EQ(first[5], static_cast<std::uint8_t>(17), "row 0 of column 0");

    const auto& last_column = frame->packets[8].bytes;
    ASSERT_EQ(last_column[4], static_cast<std::uint8_t>(8), "last column index");
    ASSERT_EQ(last_column[5 + 33], static_cast<std::uint8_t>(200), "row 33 of column 8");

    const auto& commit = frame->packets.back().bytes;
    ASSERT_EQ(commit[3], static_cast<std::uint8_t>(wire::Command::DrawBuffer), "frame ends with draw buffer");
    ASSERT_EQ(commit.size(), wire::kPacketLength, "draw buffer is padded like any setter");
    ASSERT_EQ(commit[4], static_cast<std::uint8_t>(0), "draw buffer has no arguments");

    auto decoded = decodeFrame(*frame, DeviceKind::LedMatrix);
    ASSERT_TRUE(decoded.has_value() && *decoded == matrix, "in-range values survive decode");
}

static void testDimensionMismatch() {
    PixelMatrix wide(10, 34);
    auto frame = encodeFrame(wide, DeviceKind::LedMatrix);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::DimensionMismatch, "10x34 is rejected");

    PixelMatrix keyboard_shaped(16, 6);
    frame = encodeFrame(keyboard_shaped, DeviceKind::LedMatrix);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::DimensionMismatch, "16x6 on an LED matrix is rejected");

    frame = encodeFrame(blankMatrix(DeviceKind::LedMatrix), DeviceKind::Other);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::UnsupportedKind, "other kinds have no frame packing");
}

static void testClamping() {
    auto matrix = blankMatrix(DeviceKind::LedMatrix);
    matrix.set(1, 1, -5);
    matrix.set(2, 2, 300);
    matrix.set(3, 3, 128);

    auto frame = encodeFrame(matrix, DeviceKind::LedMatrix);
    ASSERT_TRUE(frame.has_value(), "out-of-range values still encode");
    if (!frame) {
        return;
    }
    auto decoded = decodeFrame(*frame, DeviceKind::LedMatrix);
    ASSERT_TRUE(decoded.has_value(), "frame decodes");
    if (!decoded) {
        return;
    }
    ASSERT_EQ(decoded->at(1, 1), 0, "negative values clamp to 0");
    ASSERT_EQ(decoded->at(2, 2), 255, "large values clamp to 255");
    ASSERT_EQ(decoded->at(3, 3), 128, "in-range value unchanged");
}

static void testMonochromeFrame() {
    auto matrix = blankMatrix(DeviceKind::LedMatrix);
    matrix.set(0, 0, 1);
    matrix.set(0, 8, 40);
    matrix.set(1, 0, 300);  // clamps, still lit
    matrix.set(2, 0, -5);   // clamps to 0, unlit
    matrix.set(8, 33, 255);  // last cell

    auto frame = encodeMonochromeFrame(matrix, DeviceKind::LedMatrix);
    ASSERT_TRUE(frame.has_value(), "9x34 matrix encodes as a bitmap");
    if (!frame) {
        return;
    }
    ASSERT_EQ(frame->packets.size(), static_cast<std::size_t>(1), "single draw packet");
    const auto& bytes = frame->packets.front().bytes;
    ASSERT_EQ(bytes.size(), wire::kPacketLength, "draw is padded to the report length");
    ASSERT_EQ(bytes[3], static_cast<std::uint8_t>(wire::Command::Draw), "draw command");
    ASSERT_EQ(bytes[4], static_cast<std::uint8_t>(0x01), "(0,0) is bit 0 of byte 0");
    ASSERT_EQ(bytes[5], static_cast<std::uint8_t>(0x01), "(0,8) is bit 0 of byte 1");
    ASSERT_EQ(bytes[8], static_cast<std::uint8_t>(0x04), "(1,0) is location 34, bit 2 of byte 4");
    ASSERT_EQ(bytes[4 + 38], static_cast<std::uint8_t>(0x02), "(8,33) is location 305, bit 1 of byte 38");
    ASSERT_EQ(bytes[4 + 39], static_cast<std::uint8_t>(0), "bitmap is 39 bytes");

    auto decoded = decodeFrame(*frame, DeviceKind::LedMatrix);
    ASSERT_TRUE(decoded.has_value(), "bitmap decodes");
    if (decoded) {
        ASSERT_EQ(decoded->at(0, 8), 255, "lit cells decode at full intensity");
        ASSERT_EQ(decoded->at(1, 0), 255, "clamped cell is lit");
        ASSERT_EQ(decoded->at(2, 0), 0, "negative cell is unlit");
        ASSERT_EQ(decoded->at(4, 4), 0, "untouched cell is unlit");
    }

    PixelMatrix wrong(16, 6);
    auto rejected = encodeMonochromeFrame(wrong, DeviceKind::LedMatrix);
    ASSERT_TRUE(!rejected && rejected.error() == EncodeError::DimensionMismatch, "bitmap keeps the grid shape");
}

static void testKeyboardUnsupported() {
    auto frame = encodeFrame(PixelMatrix(16, 6), DeviceKind::KeyboardBacklight);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::UnsupportedKind, "keyboards draw nothing");
    frame = encodeMonochromeFrame(PixelMatrix(16, 6), DeviceKind::KeyboardBacklight);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::UnsupportedKind, "keyboards have no bitmap");
    frame = encodeBrightness(10, DeviceKind::KeyboardBacklight);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::UnsupportedKind, "keyboard brightness");
    frame = encodeSleep(true, DeviceKind::KeyboardBacklight);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::UnsupportedKind, "keyboard sleep");
    frame = encodeStatusQuery(DeviceKind::KeyboardBacklight);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::UnsupportedKind, "keyboard status");
}

static void testBrightness() {
    auto frame = encodeBrightness(128, DeviceKind::LedMatrix);
    ASSERT_TRUE(frame.has_value() && frame->packets.size() == 1, "brightness is one packet");
    if (frame) {
        const auto& bytes = frame->packets.front().bytes;
        ASSERT_EQ(bytes[3], static_cast<std::uint8_t>(wire::Command::Brightness), "brightness command");
        ASSERT_EQ(bytes[4], static_cast<std::uint8_t>(128), "level follows the command");
    }

    frame = encodeBrightness(0, DeviceKind::LedMatrix);
    ASSERT_TRUE(frame.has_value(), "level 0 encodes");
    if (frame) {
        const auto& bytes = frame->packets.front().bytes;
        ASSERT_EQ(bytes.size(), wire::kPacketLength, "setter is padded");
        ASSERT_EQ(frame->packets.front().response_length, static_cast<std::size_t>(0), "setters expect no response");
    }

    frame = encodeBrightness(256, DeviceKind::LedMatrix);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::OutOfRange, "256 is out of range");
    frame = encodeBrightness(-1, DeviceKind::LedMatrix);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::OutOfRange, "-1 is out of range");
}

static void testPatternsAndToggles() {
    auto frame = encodePattern(Pattern::percent(40), DeviceKind::LedMatrix);
    ASSERT_TRUE(frame.has_value(), "percentage pattern encodes");
    if (frame) {
        const auto& bytes = frame->packets.front().bytes;
        ASSERT_EQ(bytes[3], static_cast<std::uint8_t>(wire::Command::Pattern), "pattern command");
        ASSERT_EQ(bytes[4], static_cast<std::uint8_t>(PatternId::Percentage), "pattern id");
        ASSERT_EQ(bytes[5], static_cast<std::uint8_t>(40), "percentage argument");
    }

    frame = encodePattern(Pattern::percent(101), DeviceKind::LedMatrix);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::OutOfRange, "percentage above 100");

    frame = encodePattern(Pattern{PatternId::ZigZag, 0}, DeviceKind::KeyboardBacklight);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::UnsupportedKind, "keyboards have no patterns");

    frame = encodeSleep(true, DeviceKind::LedMatrix);
    ASSERT_TRUE(frame.has_value() && frame->packets.front().bytes[4] == 1, "sleep on");

    frame = encodeAnimation(false, DeviceKind::Other);
    ASSERT_TRUE(!frame && frame.error() == EncodeError::UnsupportedKind, "other kinds cannot animate");
}

static void testStatus() {
    auto query = encodeStatusQuery(DeviceKind::LedMatrix);
    ASSERT_TRUE(query.has_value() && query->packets.size() == 3, "status query is three packets");
    if (query) {
        for (const auto& packet : query->packets) {
            ASSERT_EQ(packet.response_length, wire::kResponseLength, "each query expects a response");
            ASSERT_EQ(packet.bytes.size(), wire::kQueryLength, "queries are the bare header");
        }
    }

    DeviceStatus status;
    status.brightness = 77;
    status.sleeping = true;
    status.firmware = FirmwareVersion{0, 1, 9, true};

    auto encoded = encodeStatus(status);
    ASSERT_TRUE(encoded.has_value(), "status encodes");
    if (!encoded) {
        return;
    }
    const auto& bytes = *encoded;
    ASSERT_EQ(bytes.size(), 3 * wire::kResponseLength, "status block size");
    ASSERT_EQ(bytes[2 * wire::kResponseLength + 1], static_cast<std::uint8_t>(0x19), "minor and patch share a byte");
    auto decoded = decodeStatus(bytes);
    ASSERT_TRUE(decoded.has_value() && *decoded == status, "status decodes to the same value");

    auto truncated = bytes;
    truncated.pop_back();
    auto failed = decodeStatus(truncated);
    ASSERT_TRUE(!failed && failed.error() == DecodeError::Malformed, "short status block");

    auto bad_sleep = bytes;
    bad_sleep[wire::kResponseLength] = 2;
    failed = decodeStatus(bad_sleep);
    ASSERT_TRUE(!failed && failed.error() == DecodeError::Malformed, "sleep byte must be 0 or 1");

    status.firmware.minor = 16;
    auto overflow = encodeStatus(status);
    ASSERT_TRUE(!overflow && overflow.error() == EncodeError::OutOfRange, "minor above 15 is rejected");
    status.firmware.minor = 1;
    status.firmware.patch = 16;
    overflow = encodeStatus(status);
    ASSERT_TRUE(!overflow && overflow.error() == EncodeError::OutOfRange, "patch above 15 is rejected");
}

static void testMalformedFrame() {
    auto frame = encodeFrame(blankMatrix(DeviceKind::LedMatrix), DeviceKind::LedMatrix);
    if (!frame) {
        ASSERT_TRUE(false, "blank frame encodes");
        return;
    }
    auto truncated = *frame;
    truncated.packets.pop_back();
    auto decoded = decodeFrame(truncated, DeviceKind::LedMatrix);
    ASSERT_TRUE(!decoded && decoded.error() == DecodeError::Malformed, "missing commit packet");

    auto corrupted = *frame;
    corrupted.packets[2].bytes[1] = 0x00;
    decoded = decodeFrame(corrupted, DeviceKind::LedMatrix);
    ASSERT_TRUE(!decoded && decoded.error() == DecodeError::Malformed, "bad magic");

    auto swapped = *frame;
    std::swap(swapped.packets[0], swapped.packets[1]);
    decoded = decodeFrame(swapped, DeviceKind::LedMatrix);
    ASSERT_TRUE(!decoded && decoded.error() == DecodeError::Malformed, "columns out of order");

    CommandFrame queries;
    queries.packets.push_back(wire::makeQuery(wire::Command::Draw));
    decoded = decodeFrame(queries, DeviceKind::LedMatrix);
    ASSERT_TRUE(!decoded && decoded.error() == DecodeError::Malformed, "a query is not a frame");
}

int main() {
    testLedMatrixFrame();
    testDimensionMismatch();
    testClamping();
    testMonochromeFrame();
    testKeyboardUnsupported();
    testBrightness();
    testPatternsAndToggles();
    testStatus();
    testMalformedFrame();
    return finishTests("Frame codec");
}
