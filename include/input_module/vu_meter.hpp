#pragma once

#include <cstddef>
#include <vector>

#include "input_module/pixel_matrix.hpp"

namespace fw::iom {

// Bars per LED matrix; the middle column is a divider.
inline constexpr std::size_t kVuMeterBars = 8;

struct VuMeterStyle {
    int background{2};
    int bar_intensity{20};
};

// Draws one bar per value (percent, clamped to 0..100) across the lower 20 rows
// of a 9x34 matrix. Extra values beyond kVuMeterBars are ignored.
void drawVuMeter(PixelMatrix& matrix, const std::vector<int>& loads, const VuMeterStyle& style = {});

}  // namespace fw::iom
