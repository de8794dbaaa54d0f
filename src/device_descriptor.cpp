#include "input_module/device_descriptor.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace fw::iom {

DeviceDescriptor::DeviceDescriptor(std::uint16_t vendor_id,
                                   std::uint16_t product_id,
                                   std::string path,
                                   DeviceKind kind,
                                   std::string name,
                                   std::string serial)
    : vendor_id_(vendor_id),
      product_id_(product_id),
      path_(std::move(path)),
      kind_(kind),
      name_(std::move(name)),
      serial_(std::move(serial)) {}

std::string DeviceDescriptor::describe() const {
    std::ostringstream oss;
    oss << (name_.empty() ? toString(kind_) : name_) << " ("
        << std::hex << std::setfill('0')
        << std::setw(4) << vendor_id_ << ':' << std::setw(4) << product_id_
        << std::dec << ") at " << path_;
    return oss.str();
}

}  // namespace fw::iom
