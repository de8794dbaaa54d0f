#include "input_module/hidapi_transport.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <iostream>
#include <string>
#include <utility>

#include "input_module/errors.hpp"

namespace fw::iom {

namespace {

std::string narrow(const wchar_t* wide) {
    if (wide == nullptr) {
        return {};
    }

    std::string result;
    while (*wide != L'\0') {
        wchar_t wc = *wide++;
        if (wc < 0x80) {
            result.push_back(static_cast<char>(wc));
        } else {
            result.push_back('?');
        }
    }
    return result;
}

std::string narrowError(hid_device* device) {
    const wchar_t* werror = hid_error(device);
    if (werror == nullptr) {
        return "unknown";
    }
    return narrow(werror);
}

int toMilliseconds(std::chrono::milliseconds timeout) {
    return static_cast<int>(std::clamp<std::chrono::milliseconds::rep>(timeout.count(), 0, INT_MAX));
}

// hidraw reports failures through errno; the libusb backend leaves it unset,
// which classifies as a disconnect and lets the session reopen.
WriteError classifyWriteErrno(int error) {
    switch (error) {
        case ETIMEDOUT:
        case EAGAIN:
        case EINTR:
            return WriteError::Timeout;
        default:
            return WriteError::Disconnected;
    }
}

OpenError classifyOpenErrno(int error) {
    switch (error) {
        case EACCES:
        case EPERM:
            return OpenError::PermissionDenied;
        case EBUSY:
            return OpenError::AlreadyHeld;
        default:
            return OpenError::Unavailable;
    }
}

}  // namespace

HidapiContext::HidapiContext() {
    if (hid_init() != 0) {
        std::cerr << "[HidapiTransport] hid_init failed" << '\n';
        return;
    }
    initialized_ = true;
}

HidapiContext::~HidapiContext() {
    if (initialized_) {
        hid_exit();
    }
}

void HidapiTransport::HidDeleter::operator()(hid_device* device) const noexcept {
    if (device != nullptr) {
        hid_close(device);
    }
}

HidapiTransport::HidapiTransport(HidapiContextPtr context, hid_device* device, std::string path)
    : context_(std::move(context)), path_(std::move(path)), handle_(device) {}

HidapiTransport::~HidapiTransport() {
    close();
}

std::string HidapiTransport::id() const {
    return "hidapi";
}

expected<void> HidapiTransport::write(const std::vector<std::uint8_t>& bytes,
                                      std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
        return unexpected(make_error_code(WriteError::Disconnected));
    }

    // hid_write has no timeout of its own; the kernel bounds the transfer and a
    // write that completes after the deadline is reported as a timeout.
    const auto started = std::chrono::steady_clock::now();
    errno = 0;
    const int res = hid_write(handle_.get(), bytes.data(), bytes.size());
    const auto elapsed = std::chrono::steady_clock::now() - started;

    if (res < 0) {
        const auto error = classifyWriteErrno(errno);
        std::cerr << "[HidapiTransport] write failed on " << path_ << " ("
                  << bytes.size() << " bytes): " << narrowError(handle_.get()) << '\n';
        return unexpected(make_error_code(error));
    }
    if (static_cast<std::size_t>(res) < bytes.size()) {
        std::cerr << "[HidapiTransport] short write on " << path_ << ": " << res
                  << " of " << bytes.size() << " bytes" << '\n';
        return unexpected(make_error_code(WriteError::ShortWrite));
    }
    if (elapsed > timeout) {
        return unexpected(make_error_code(WriteError::Timeout));
    }
    return {};
}

expected<std::size_t> HidapiTransport::read(std::vector<std::uint8_t>& buffer,
                                            std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
        return unexpected(make_error_code(ReadError::Disconnected));
    }

    const int res = hid_read_timeout(handle_.get(), buffer.data(), buffer.size(), toMilliseconds(timeout));
    if (res < 0) {
        std::cerr << "[HidapiTransport] read failed on " << path_ << ": "
                  << narrowError(handle_.get()) << '\n';
        return unexpected(make_error_code(ReadError::Disconnected));
    }
    if (res == 0) {
        return unexpected(make_error_code(ReadError::Timeout));
    }
    return static_cast<std::size_t>(res);
}

void HidapiTransport::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    handle_.reset();
}

bool HidapiTransport::isOpen() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ != nullptr;
}

HidapiTransportFactory::HidapiTransportFactory(HidapiContextPtr context)
    : context_(std::move(context)) {}

std::string HidapiTransportFactory::id() const {
    return "hidapi";
}

expected<std::unique_ptr<DeviceTransport>> HidapiTransportFactory::open(const DeviceDescriptor& descriptor) {
    if (!context_ || !context_->initialized()) {
        return unexpected(make_error_code(OpenError::Unavailable));
    }

    errno = 0;
    hid_device* device = hid_open_path(descriptor.path().c_str());
    if (device == nullptr) {
        const auto error = classifyOpenErrno(errno);
        std::cerr << "[HidapiTransport] Unable to open " << descriptor.describe() << ": "
                  << narrowError(nullptr) << '\n';
        return unexpected(make_error_code(error));
    }

    std::cout << "[HidapiTransport] Connected to " << descriptor.describe() << '\n';
    return std::make_unique<HidapiTransport>(context_, device, descriptor.path());
}

HidapiRegistry::HidapiRegistry(HidapiContextPtr context)
    : context_(std::move(context)) {}

std::string HidapiRegistry::id() const {
    return "hidapi";
}

std::vector<RegistryEntry> HidapiRegistry::enumerate() {
    std::vector<RegistryEntry> entries;
    if (!context_ || !context_->initialized()) {
        return entries;
    }

    hid_device_info* list = hid_enumerate(0, 0);
    for (auto* current = list; current != nullptr; current = current->next) {
        RegistryEntry entry;
        entry.vendor_id = current->vendor_id;
        entry.product_id = current->product_id;
        entry.path = current->path != nullptr ? current->path : "";
        entry.serial = narrow(current->serial_number);
        entry.product = narrow(current->product_string);
        entry.usage_page = current->usage_page;
        entry.usage = current->usage;
        entry.interface_number = current->interface_number;
        entries.push_back(std::move(entry));
    }
    hid_free_enumeration(list);
    return entries;
}

}  // namespace fw::iom
