#ifndef INCLUDE_BADGEGATE_DEVICE_DEVICEERRORS_HPP
#define INCLUDE_BADGEGATE_DEVICE_DEVICEERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <variant>

namespace badgegate::device
{

// Thrown by IHidBackend::open when the OS refuses the device.
class HidOpenError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Thrown by IHidDevice::read on a failed read; the polling loop treats it as transient.
class HidReadError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class DeviceError : std::uint8_t
{
    DeviceUnavailable,
    ConnectionFailed,
};

template <class T> using DeviceResult = std::variant<T, DeviceError>;

[[nodiscard]] constexpr std::string_view describe(DeviceError error) noexcept
{
    switch (error)
    {
    case DeviceError::DeviceUnavailable:
        return "no matching card reader found";
    case DeviceError::ConnectionFailed:
        return "card reader could not be opened";
    }
    return "unknown device error";
}

} // namespace badgegate::device

#endif // INCLUDE_BADGEGATE_DEVICE_DEVICEERRORS_HPP
