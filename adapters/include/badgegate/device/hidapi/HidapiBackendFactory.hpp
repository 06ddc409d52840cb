#ifndef INCLUDE_BADGEGATE_DEVICE_HIDAPI_HIDAPIBACKENDFACTORY_HPP
#define INCLUDE_BADGEGATE_DEVICE_HIDAPI_HIDAPIBACKENDFACTORY_HPP

#include "badgegate/device/IHidDevice.hpp"
#include <memory>

namespace badgegate::device::hidapi
{

// HID backend over hidapi (hidraw flavour on Linux). Throws HidOpenError when hid_init() fails.
[[nodiscard]] std::unique_ptr<badgegate::device::IHidBackend> makeHidapiBackend();

} // namespace badgegate::device::hidapi

#endif // INCLUDE_BADGEGATE_DEVICE_HIDAPI_HIDAPIBACKENDFACTORY_HPP
