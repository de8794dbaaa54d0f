#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "input_module/device_signature.hpp"
#include "input_module/retry_policy.hpp"

namespace fw::iom {

// Settings of the computer_stats content producer.
struct StatsConfig {
    int brightness{255};
    std::chrono::milliseconds frame_interval{1000};
    int background{2};
    int bar_intensity{20};
    std::size_t max_displays{2};
};

struct RuntimeConfig {
    std::string transport{"hidapi"};
    RetryPolicy retry;
    std::vector<DeviceSignature> signatures;  // in addition to the built-in table
    StatsConfig stats;
};

// Reads TOML configuration. Every key is optional; malformed files and values
// of the wrong type or range throw std::runtime_error.
class ConfigLoader {
public:
    [[nodiscard]] RuntimeConfig loadFromFile(const std::string& path) const;
    [[nodiscard]] RuntimeConfig loadFromString(std::string_view text,
                                               const std::string& source = "<string>") const;
};

}  // namespace fw::iom
