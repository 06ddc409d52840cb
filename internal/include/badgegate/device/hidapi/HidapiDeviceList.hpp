#ifndef INCLUDE_BADGEGATE_DEVICE_HIDAPI_HIDAPIDEVICELIST_HPP
#define INCLUDE_BADGEGATE_DEVICE_HIDAPI_HIDAPIDEVICELIST_HPP

#include "badgegate/device/IHidDevice.hpp"
#include <hidapi.h>
#include <string>
#include <vector>

namespace badgegate::device::hidapi
{

// UTF-8 copy of a hidapi wide string. nullptr yields an empty string.
[[nodiscard]] std::string narrowHidString(const wchar_t* text);

// Flattens a hid_enumerate() list. Entries without a path and repeated paths are skipped;
// the result is ordered by path.
[[nodiscard]] std::vector<badgegate::device::HidDeviceInfo> toDeviceInfos(const hid_device_info* head);

} // namespace badgegate::device::hidapi

#endif // INCLUDE_BADGEGATE_DEVICE_HIDAPI_HIDAPIDEVICELIST_HPP
