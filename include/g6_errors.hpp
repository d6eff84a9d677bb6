#pragma once

#include <cstdint>

namespace g6
{

enum class Error : uint8_t
{
    Ok = 0,
    // Connect errors
    NotFound,
    ConnectFailed,
    // Transport errors
    Timeout,
    DeviceGone,
    IoError,
    // Device errors
    InvalidOperation,
    UnconfirmedWrite,
    Disconnected,
};

constexpr const char* error_str(Error err)
{
    switch (err) {
        case Error::Ok:               return "Success";
        case Error::NotFound:         return "Device not found";
        case Error::ConnectFailed:    return "Device stopped answering during the handshake";
        case Error::Timeout:          return "Read timed out";
        case Error::DeviceGone:       return "Device was removed";
        case Error::IoError:          return "I/O error";
        case Error::InvalidOperation: return "Invalid operation or out of range value";
        case Error::UnconfirmedWrite: return "Write was sent but not confirmed by the device";
        case Error::Disconnected:     return "Device is disconnected";
        default:                      return "Unknown error";
    }
}

// DeviceGone ends the session, every other transport error does not
constexpr bool is_terminal(Error err)
{
    return err == Error::DeviceGone || err == Error::Disconnected;
}

} // namespace g6
