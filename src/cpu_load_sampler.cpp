#include "input_module/cpu_load_sampler.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace fw::iom {

CpuLoadSampler::CpuLoadSampler(std::string stat_path)
    : stat_path_(std::move(stat_path)) {}

std::vector<int> CpuLoadSampler::sample() {
    std::ifstream in(stat_path_);
    if (!in) {
        std::cerr << "[computer_stats] Unable to read " << stat_path_ << '\n';
        return {};
    }
    return sample(in);
}

std::vector<int> CpuLoadSampler::sample(std::istream& stat) {
    std::vector<CoreTimes> current;
    std::string line;
    while (std::getline(stat, line)) {
        // Per-core lines are "cpuN ..."; the aggregate "cpu " line is skipped.
        if (line.size() < 4 || line.compare(0, 3, "cpu") != 0 || line[3] == ' ') {
            continue;
        }

        std::istringstream fields(line);
        std::string label;
        fields >> label;

        std::uint64_t value = 0;
        std::vector<std::uint64_t> columns;
        while (fields >> value) {
            columns.push_back(value);
        }
        if (columns.size() < 4) {
            continue;
        }

        CoreTimes times;
        // idle + iowait
        times.idle = columns[3] + (columns.size() > 4 ? columns[4] : 0);
        for (auto column : columns) {
            times.total += column;
        }
        current.push_back(times);
    }

    std::vector<int> loads;
    loads.reserve(current.size());
    for (std::size_t i = 0; i < current.size(); ++i) {
        CoreTimes delta = current[i];
        if (i < previous_.size()) {
            delta.idle -= std::min(delta.idle, previous_[i].idle);
            delta.total -= std::min(delta.total, previous_[i].total);
        }
        if (delta.total == 0) {
            loads.push_back(0);
            continue;
        }
        const auto busy = delta.total - std::min(delta.idle, delta.total);
        loads.push_back(static_cast<int>((busy * 100) / delta.total));
    }

    previous_ = std::move(current);
    return loads;
}

}  // namespace fw::iom
