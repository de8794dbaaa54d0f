#pragma once

#include <system_error>
#include <type_traits>

namespace fw::iom {

enum class OpenError {
    Unavailable = 1,
    PermissionDenied,
    AlreadyHeld,
};

enum class WriteError {
    Timeout = 1,
    ShortWrite,
    Disconnected,
};

enum class ReadError {
    Timeout = 1,
    Disconnected,
};

enum class EncodeError {
    DimensionMismatch = 1,
    OutOfRange,
    UnsupportedKind,
};

enum class DecodeError {
    Malformed = 1,
};

enum class SendError {
    RetriesExhausted = 1,
    SessionFailed,
    Disconnected,
    NotConnected,
};

const std::error_category& openErrorCategory() noexcept;
const std::error_category& writeErrorCategory() noexcept;
const std::error_category& readErrorCategory() noexcept;
const std::error_category& encodeErrorCategory() noexcept;
const std::error_category& decodeErrorCategory() noexcept;
const std::error_category& sendErrorCategory() noexcept;

std::error_code make_error_code(OpenError error) noexcept;
std::error_code make_error_code(WriteError error) noexcept;
std::error_code make_error_code(ReadError error) noexcept;
std::error_code make_error_code(EncodeError error) noexcept;
std::error_code make_error_code(DecodeError error) noexcept;
std::error_code make_error_code(SendError error) noexcept;

}  // namespace fw::iom

namespace std {

template <>
struct is_error_code_enum<fw::iom::OpenError> : true_type {};
template <>
struct is_error_code_enum<fw::iom::WriteError> : true_type {};
template <>
struct is_error_code_enum<fw::iom::ReadError> : true_type {};
template <>
struct is_error_code_enum<fw::iom::EncodeError> : true_type {};
template <>
struct is_error_code_enum<fw::iom::DecodeError> : true_type {};
template <>
struct is_error_code_enum<fw::iom::SendError> : true_type {};

}  // namespace std
