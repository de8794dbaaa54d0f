#include "input_module/pixel_matrix.hpp"

#include <algorithm>
#include <stdexcept>

namespace fw::iom {

void PixelMatrix::set(std::size_t x, std::size_t y, int value) {
    if (x >= width_ || y >= height_) {
        throw std::out_of_range("PixelMatrix::set coordinate out of range");
    }
    cells_[indexOf(x, y)] = value;
}

int PixelMatrix::at(std::size_t x, std::size_t y) const {
    if (x >= width_ || y >= height_) {
        throw std::out_of_range("PixelMatrix::at coordinate out of range");
    }
    return cells_[indexOf(x, y)];
}

void PixelMatrix::fill(int value) {
    std::fill(cells_.begin(), cells_.end(), value);
}

void PixelMatrix::drawBox(std::size_t x1, std::size_t y1,
                          std::size_t x2, std::size_t y2, int value) {
    const auto x_min = std::min(x1, x2);
    const auto x_max = std::max(x1, x2);
    const auto y_min = std::min(y1, y2);
    const auto y_max = std::max(y1, y2);

    if (x_max >= width_ || y_max >= height_) {
        throw std::out_of_range("PixelMatrix::drawBox corner out of range");
    }

    for (auto y = y_min; y <= y_max; ++y) {
        for (auto x = x_min; x <= x_max; ++x) {
            cells_[indexOf(x, y)] = value;
        }
    }
}

bool operator==(const PixelMatrix& lhs, const PixelMatrix& rhs) {
    return lhs.width() == rhs.width() && lhs.height() == rhs.height() &&
           lhs.cells() == rhs.cells();
}

}  // namespace fw::iom
