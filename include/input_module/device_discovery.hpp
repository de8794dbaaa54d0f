#pragma once

#include <vector>

#include "input_module/device_descriptor.hpp"
#include "input_module/device_registry.hpp"
#include "input_module/device_signature.hpp"

namespace fw::iom {

// Snapshot of attached modules matching the signature table, one descriptor per
// path, sorted by path. Unknown devices are skipped; an empty result is not an
// error.
[[nodiscard]] std::vector<DeviceDescriptor> discover(DeviceRegistry& registry,
                                                     const SignatureTable& signatures);

}  // namespace fw::iom
