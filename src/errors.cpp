#include "input_module/errors.hpp"

#include <string>

namespace fw::iom {

namespace {

class OpenErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "input_module.open"; }

    std::string message(int value) const override {
        switch (static_cast<OpenError>(value)) {
            case OpenError::Unavailable:
                return "device address is unavailable";
            case OpenError::PermissionDenied:
                return "permission denied opening device";
            case OpenError::AlreadyHeld:
                return "device is already held by another session";
        }
        return "unknown open error";
    }
};

class WriteErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "input_module.write"; }

    std::string message(int value) const override {
        switch (static_cast<WriteError>(value)) {
            case WriteError::Timeout:
                return "write timed out";
            case WriteError::ShortWrite:
                return "device accepted fewer bytes than written";
            case WriteError::Disconnected:
                return "device disconnected during write";
        }
        return "unknown write error";
    }
};

class ReadErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "input_module.read"; }

    std::string message(int value) const override {
        switch (static_cast<ReadError>(value)) {
            case ReadError::Timeout:
                return "read timed out";
            case ReadError::Disconnected:
                return "device disconnected during read";
        }
        return "unknown read error";
    }
};

class EncodeErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "input_module.encode"; }

    std::string message(int value) const override {
        switch (static_cast<EncodeError>(value)) {
            case EncodeError::DimensionMismatch:
                return "matrix dimensions do not match the device kind";
            case EncodeError::OutOfRange:
                return "value outside the device's documented range";
            case EncodeError::UnsupportedKind:
                return "device kind does not support this command";
        }
        return "unknown encode error";
    }
};

class DecodeErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "input_module.decode"; }

    std::string message(int value) const override {
        switch (static_cast<DecodeError>(value)) {
            case DecodeError::Malformed:
                return "malformed device response";
        }
        return "unknown decode error";
    }
};

class SendErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "input_module.send"; }

    std::string message(int value) const override {
        switch (static_cast<SendError>(value)) {
            case SendError::RetriesExhausted:
                return "retries exhausted";
            case SendError::SessionFailed:
                return "session has failed and must be reopened";
            case SendError::Disconnected:
                return "device disconnected and could not be reopened";
            case SendError::NotConnected:
                return "session is closed";
        }
        return "unknown send error";
    }
};

}  // namespace

const std::error_category& openErrorCategory() noexcept {
    static const OpenErrorCategory category;
    return category;
}

const std::error_category& writeErrorCategory() noexcept {
    static const WriteErrorCategory category;
    return category;
}

const std::error_category& readErrorCategory() noexcept {
    static const ReadErrorCategory category;
    return category;
}

const std::error_category& encodeErrorCategory() noexcept {
    static const EncodeErrorCategory category;
    return category;
}

const std::error_category& decodeErrorCategory() noexcept {
    static const DecodeErrorCategory category;
    return category;
}

const std::error_category& sendErrorCategory() noexcept {
    static const SendErrorCategory category;
    return category;
}

std::error_code make_error_code(OpenError error) noexcept {
    return {static_cast<int>(error), openErrorCategory()};
}

std::error_code make_error_code(WriteError error) noexcept {
    return {static_cast<int>(error), writeErrorCategory()};
}

std::error_code make_error_code(ReadError error) noexcept {
    return {static_cast<int>(error), readErrorCategory()};
}

std::error_code make_error_code(EncodeError error) noexcept {
    return {static_cast<int>(error), encodeErrorCategory()};
}

std::error_code make_error_code(DecodeError error) noexcept {
    return {static_cast<int>(error), decodeErrorCategory()};
}

std::error_code make_error_code(SendError error) noexcept {
    return {static_cast<int>(error), sendErrorCategory()};
}

}  // namespace fw::iom
