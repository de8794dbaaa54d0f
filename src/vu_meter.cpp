#include "input_module/vu_meter.hpp"

#include <algorithm>
#include <stdexcept>

namespace fw::iom {

void drawVuMeter(PixelMatrix& matrix, const std::vector<int>& loads, const VuMeterStyle& style) {
    const auto width = matrix.width();
    const auto height = matrix.height();
    if (width < kVuMeterBars + 1 || height < 20) {
        throw std::invalid_argument("drawVuMeter: matrix too small");
    }

    matrix.fill(style.background);
    // Frame: dark top and bottom rows around the meter area, dark divider.
    matrix.drawBox(0, height - 20, width - 1, height - 1, 0);
    matrix.drawBox(0, height - 19, width - 1, height - 2, style.background);
    matrix.drawBox(width / 2, height - 19, width / 2, height - 2, 0);

    const auto count = std::min(loads.size(), kVuMeterBars);
    for (std::size_t i = 0; i < count; ++i) {
        const auto load = static_cast<std::size_t>(std::clamp(loads[i], 0, 100));
        const auto bar_top = height - 2 - (17 * load) / 100;
        const auto column = i < kVuMeterBars / 2 ? i : i + 1;
        matrix.drawBox(column, bar_top, column, height - 2, style.bar_intensity);
    }
}

}  // namespace fw::iom
