#include "input_module/device_discovery.hpp"

#include <algorithm>
#include <unordered_set>

namespace fw::iom {

std::vector<DeviceDescriptor> discover(DeviceRegistry& registry,
                                       const SignatureTable& signatures) {
    std::vector<DeviceDescriptor> found;
    std::unordered_set<std::string> seen_paths;

    for (const auto& entry : registry.enumerate()) {
        if (entry.path.empty()) {
            continue;
        }
        const auto* signature = signatures.match(entry);
        if (signature == nullptr) {
            continue;
        }
        // hidraw lists one entry per top-level usage of the same node.
        if (!seen_paths.insert(entry.path).second) {
            continue;
        }
        found.emplace_back(entry.vendor_id,
                           entry.product_id,
                           entry.path,
                           signature->kind,
                           signature->name,
                           entry.serial);
    }

    std::sort(found.begin(), found.end());
    return found;
}

}  // namespace fw::iom
