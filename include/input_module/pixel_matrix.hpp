#pragma once

#include <cstddef>
#include <vector>

namespace fw::iom {

// Grid of intensities addressed as (x, y) with x across the width. Values are
// stored unclamped; the frame codec clamps them to the device range.
class PixelMatrix {
public:
    PixelMatrix() = default;
    PixelMatrix(std::size_t width, std::size_t height, int value = 0)
        : width_(width), height_(height), cells_(width * height, value) {}

    [[nodiscard]] std::size_t width() const noexcept { return width_; }
    [[nodiscard]] std::size_t height() const noexcept { return height_; }
    [[nodiscard]] std::size_t size() const noexcept { return cells_.size(); }

    void set(std::size_t x, std::size_t y, int value);
    [[nodiscard]] int at(std::size_t x, std::size_t y) const;

    void fill(int value);

    // Fills the inclusive rectangle spanned by the two corners, in any order.
    void drawBox(std::size_t x1, std::size_t y1, std::size_t x2, std::size_t y2, int value);

    [[nodiscard]] const std::vector<int>& cells() const noexcept { return cells_; }

private:
    [[nodiscard]] std::size_t indexOf(std::size_t x, std::size_t y) const noexcept {
        return y * width_ + x;
    }

    std::size_t width_{0};
    std::size_t height_{0};
    std::vector<int> cells_;
};

bool operator==(const PixelMatrix& lhs, const PixelMatrix& rhs);
inline bool operator!=(const PixelMatrix& lhs, const PixelMatrix& rhs) { return !(lhs == rhs); }

}  // namespace fw::iom
