#include "input_module/device_lease.hpp"

#include <utility>

#include "input_module/errors.hpp"

namespace fw::iom {

DeviceLease::DeviceLease(DeviceLeaseTable& table, std::string path)
    : table_(&table), path_(std::move(path)) {}

DeviceLease::~DeviceLease() {
    release();
}

DeviceLease::DeviceLease(DeviceLease&& other) noexcept
    : table_(other.table_), path_(std::move(other.path_)) {
    other.table_ = nullptr;
}

DeviceLease& DeviceLease::operator=(DeviceLease&& other) noexcept {
    if (this != &other) {
        release();
        table_ = other.table_;
        path_ = std::move(other.path_);
        other.table_ = nullptr;
    }
    return *this;
}

void DeviceLease::release() noexcept {
    if (table_ != nullptr) {
        table_->release(path_);
        table_ = nullptr;
    }
}

expected<DeviceLease> DeviceLeaseTable::acquire(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_.insert(path).second) {
        return unexpected(make_error_code(OpenError::AlreadyHeld));
    }
    return DeviceLease(*this, path);
}

bool DeviceLeaseTable::isHeld(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(path) != 0;
}

std::size_t DeviceLeaseTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

void DeviceLeaseTable::release(const std::string& path) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(path);
}

}  // namespace fw::iom
