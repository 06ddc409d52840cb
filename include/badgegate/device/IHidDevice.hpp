#ifndef INCLUDE_BADGEGATE_DEVICE_IHIDDEVICE_HPP
#define INCLUDE_BADGEGATE_DEVICE_IHIDDEVICE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace badgegate::device
{

struct HidDeviceInfo final
{
    std::uint16_t vendorId{};
    std::uint16_t productId{};
    std::string productString;
    std::string manufacturerString;
    // Backend specific handle, e.g. /dev/hidraw3.
    std::string path;
};

class IHidDevice
{
public:
    IHidDevice() = default;
    IHidDevice(const IHidDevice&) = delete;
    IHidDevice& operator=(const IHidDevice&) = delete;
    IHidDevice(IHidDevice&&) = delete;
    IHidDevice& operator=(IHidDevice&&) = delete;
    virtual ~IHidDevice() = default;

    // Waits up to `timeout` for one input report. Returns an empty vector on timeout.
    // Throws HidReadError when the device fails or disappears.
    [[nodiscard]] virtual std::vector<std::uint8_t> read(std::chrono::milliseconds timeout) = 0;

    // Idempotent.
    virtual void close() noexcept = 0;
};

class IHidBackend
{
public:
    IHidBackend() = default;
    IHidBackend(const IHidBackend&) = delete;
    IHidBackend& operator=(const IHidBackend&) = delete;
    IHidBackend(IHidBackend&&) = delete;
    IHidBackend& operator=(IHidBackend&&) = delete;
    virtual ~IHidBackend() = default;

    [[nodiscard]] virtual std::vector<HidDeviceInfo> enumerate() const = 0;

    // Opens the device in non-blocking mode. Throws HidOpenError on OS failure.
    [[nodiscard]] virtual std::unique_ptr<IHidDevice> open(const HidDeviceInfo& info) = 0;
};

} // namespace badgegate::device

#endif // INCLUDE_BADGEGATE_DEVICE_IHIDDEVICE_HPP
