#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace fw::iom {

// Per-core CPU load from /proc/stat, as the share of non-idle time between two
// successive samples.
class CpuLoadSampler {
public:
    explicit CpuLoadSampler(std::string stat_path = "/proc/stat");

    // Load per core in percent (0..100). The first call measures against the
    // time since boot.
    [[nodiscard]] std::vector<int> sample();

    // Same as sample() but reads counters from the given stream.
    [[nodiscard]] std::vector<int> sample(std::istream& stat);

private:
    struct CoreTimes {
        std::uint64_t idle{0};
        std::uint64_t total{0};
    };

    std::string stat_path_;
    std::vector<CoreTimes> previous_;
};

}  // namespace fw::iom
