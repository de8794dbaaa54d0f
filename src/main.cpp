#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "input_module/config_loader.hpp"
#include "input_module/cpu_load_sampler.hpp"
#include "input_module/device_bus.hpp"
#include "input_module/device_session.hpp"
#include "input_module/frame_codec.hpp"
#include "input_module/vu_meter.hpp"

using fw::iom::ConfigLoader;
using fw::iom::CpuLoadSampler;
using fw::iom::DeviceBus;
using fw::iom::DeviceDescriptor;
using fw::iom::DeviceKind;
using fw::iom::DeviceSession;
using fw::iom::RuntimeConfig;
using fw::iom::SessionPhase;
using fw::iom::SignatureTable;
using fw::iom::VuMeterStyle;

namespace {

std::atomic<bool> g_running{true};

void handleSignal(int) {
    g_running.store(false);
}

struct Display {
    DeviceDescriptor descriptor;
    std::unique_ptr<DeviceSession> session;
};

bool openDisplay(DeviceBus& bus, Display& display, const RuntimeConfig& config) {
    display.session.reset();
    auto session = bus.openSession(display.descriptor, config.retry);
    if (!session) {
        std::cerr << "[computer_stats] Failed to open " << display.descriptor.describe() << ": "
                  << session.error().message() << '\n';
        return false;
    }
    display.session = std::move(*session);

    if (auto result = display.session->setBrightness(config.stats.brightness); !result) {
        std::cerr << "[computer_stats] Failed to set brightness on " << display.descriptor.describe()
                  << ": " << result.error().message() << '\n';
    }
    std::cout << "[computer_stats] Drawing on " << display.descriptor.describe() << '\n';
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        RuntimeConfig config;
        if (argc > 1) {
            ConfigLoader loader;
            config = loader.loadFromFile(argv[1]);
        }

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        auto bus = fw::iom::makeBus(config.transport,
                                    SignatureTable::builtin().withAdditional(config.signatures));

        std::vector<Display> displays;
        for (auto& descriptor : bus->discover(DeviceKind::LedMatrix)) {
            if (displays.size() == config.stats.max_displays) {
                break;
            }
            displays.push_back(Display{descriptor, nullptr});
        }
        if (displays.empty()) {
            std::cerr << "[computer_stats] No LED matrix modules found\n";
            return 1;
        }
        for (auto& display : displays) {
            openDisplay(*bus, display, config);
        }

        const VuMeterStyle style{config.stats.background, config.stats.bar_intensity};
        CpuLoadSampler sampler;
        auto matrix = fw::iom::blankMatrix(DeviceKind::LedMatrix);

        while (g_running.load()) {
            const auto tick = std::chrono::steady_clock::now();
            const auto loads = sampler.sample();

            for (std::size_t i = 0; i < displays.size(); ++i) {
                auto& display = displays[i];
                if (!display.session || display.session->state().phase == SessionPhase::Failed) {
                    if (!openDisplay(*bus, display, config)) {
                        continue;
                    }
                }

                // Eight cores per display, left to right.
                const auto first = std::min(loads.size(), i * fw::iom::kVuMeterBars);
                const auto last = std::min(loads.size(), first + fw::iom::kVuMeterBars);
                std::vector<int> slice(loads.begin() + static_cast<std::ptrdiff_t>(first),
                                       loads.begin() + static_cast<std::ptrdiff_t>(last));
                fw::iom::drawVuMeter(matrix, slice, style);

                if (auto result = display.session->draw(matrix); !result) {
                    std::cerr << "[computer_stats] Draw failed on " << display.descriptor.describe() << ": "
                              << result.error().message() << '\n';
                }
            }

            const auto elapsed = std::chrono::steady_clock::now() - tick;
            if (elapsed < config.stats.frame_interval) {
                std::this_thread::sleep_for(config.stats.frame_interval - elapsed);
            }
        }

        for (auto& display : displays) {
            if (display.session) {
                display.session->close();
            }
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
