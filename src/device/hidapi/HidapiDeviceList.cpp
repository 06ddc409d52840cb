#include "badgegate/device/hidapi/HidapiDeviceList.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace badgegate::device::hidapi
{

std::string narrowHidString(const wchar_t* text)
{
    std::string out{};
    if (text == nullptr)
    {
        return out;
    }

    for (const wchar_t* it = text; *it != L'\0'; ++it)
    {
        const auto cp = static_cast<std::uint32_t>(*it);
        if (cp < 0x80U)
        {
            out.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800U)
        {
            out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
            out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        }
        else if (cp < 0x10000U && (cp < 0xD800U || cp > 0xDFFFU))
        {
            out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
            out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
            out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        }
        else if (cp >= 0x10000U && cp <= 0x10FFFFU)
        {
            out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
            out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
            out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
            out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        }
        else
        {
            // Lone surrogate or out of range.
            out.push_back('?');
        }
    }
    return out;
}

std::vector<badgegate::device::HidDeviceInfo> toDeviceInfos(const hid_device_info* head)
{
    std::vector<badgegate::device::HidDeviceInfo> out{};
    for (const hid_device_info* node = head; node != nullptr; node = node->next)
    {
        if (node->path == nullptr)
        {
            continue;
        }

        badgegate::device::HidDeviceInfo info{};
        info.vendorId = node->vendor_id;
        info.productId = node->product_id;
        info.productString = narrowHidString(node->product_string);
        info.manufacturerString = narrowHidString(node->manufacturer_string);
        info.path = node->path;

        const bool seen = std::any_of(out.begin(), out.end(),
                                      [&info](const badgegate::device::HidDeviceInfo& other)
                                      { return other.path == info.path; });
        if (!seen)
        {
            out.push_back(std::move(info));
        }
    }

    std::sort(out.begin(), out.end(),
              [](const badgegate::device::HidDeviceInfo& lhs, const badgegate::device::HidDeviceInfo& rhs)
              { return lhs.path < rhs.path; });
    return out;
}

} // namespace badgegate::device::hidapi
