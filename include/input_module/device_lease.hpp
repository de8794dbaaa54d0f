#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

#include "input_module/expected.hpp"

namespace fw::iom {

class DeviceLeaseTable;

// Exclusive claim on one device path; released on destruction.
class DeviceLease {
public:
    DeviceLease() = default;
    DeviceLease(DeviceLeaseTable& table, std::string path);
    ~DeviceLease();

    DeviceLease(const DeviceLease&) = delete;
    DeviceLease& operator=(const DeviceLease&) = delete;
    DeviceLease(DeviceLease&& other) noexcept;
    DeviceLease& operator=(DeviceLease&& other) noexcept;

    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return table_ != nullptr; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    DeviceLeaseTable* table_{nullptr};
    std::string path_;
};

// Tracks which device paths have an open session. Must outlive its leases.
class DeviceLeaseTable {
public:
    // Fails with OpenError::AlreadyHeld when the path is already leased.
    [[nodiscard]] expected<DeviceLease> acquire(const std::string& path);

    [[nodiscard]] bool isHeld(const std::string& path) const;
    [[nodiscard]] std::size_t size() const;

private:
    friend class DeviceLease;
    void release(const std::string& path) noexcept;

    mutable std::mutex mutex_;
    std::unordered_set<std::string> held_;
};

}  // namespace fw::iom
