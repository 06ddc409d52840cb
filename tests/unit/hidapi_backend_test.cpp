#include "badgegate/device/DeviceErrors.hpp"
#include "badgegate/device/hidapi/HidapiBackendFactory.hpp"
#include "badgegate/device/hidapi/HidapiDeviceList.hpp"

#include <gtest/gtest.h>

#include <hidapi.h>
#include <string>
#include <vector>

TEST(HidapiStrings, NarrowsToUtf8)
{
    EXPECT_EQ(badgegate::device::hidapi::narrowHidString(L"TS-HRW380 RFID Reader"), "TS-HRW380 RFID Reader");
    EXPECT_EQ(badgegate::device::hidapi::narrowHidString(L"Lecteur é"), "Lecteur \xC3\xA9");
    EXPECT_EQ(badgegate::device::hidapi::narrowHidString(L"€"), "\xE2\x82\xAC");
    EXPECT_EQ(badgegate::device::hidapi::narrowHidString(L"\U0001F4B3"), "\xF0\x9F\x92\xB3");
}

TEST(HidapiStrings, NullIsEmpty)
{
    EXPECT_TRUE(badgegate::device::hidapi::narrowHidString(nullptr).empty());
}

TEST(HidapiDeviceList, FlattensEnumerationOrderedByPath)
{
    std::string keyboardPath{ "/dev/hidraw1" };
    std::string readerPath{ "/dev/hidraw0" };
    std::string duplicatePath{ "/dev/hidraw0" };
    std::wstring readerName{ L"TS-HRW380 RFID Reader" };
    std::wstring readerMaker{ L"Tinkerforge" };
    std::wstring keyboardName{ L"USB Keyboard" };

    hid_device_info noPath{};
    hid_device_info duplicate{};
    duplicate.path = duplicatePath.data();
    duplicate.vendor_id = 0x25DD;
    duplicate.product_id = 0x3001;
    duplicate.next = &noPath;

    hid_device_info reader{};
    reader.path = readerPath.data();
    reader.vendor_id = 0x25DD;
    reader.product_id = 0x3000;
    reader.product_string = readerName.data();
    reader.manufacturer_string = readerMaker.data();
    reader.next = &duplicate;

    hid_device_info keyboard{};
    keyboard.path = keyboardPath.data();
    keyboard.vendor_id = 0x046D;
    keyboard.product_id = 0xC31C;
    keyboard.product_string = keyboardName.data();
    keyboard.next = &reader;

    const auto devices = badgegate::device::hidapi::toDeviceInfos(&keyboard);

    ASSERT_EQ(devices.size(), 2U);
    EXPECT_EQ(devices[0].path, "/dev/hidraw0");
    EXPECT_EQ(devices[0].vendorId, 0x25DD);
    EXPECT_EQ(devices[0].productId, 0x3000);
    EXPECT_EQ(devices[0].productString, "TS-HRW380 RFID Reader");
    EXPECT_EQ(devices[0].manufacturerString, "Tinkerforge");
    EXPECT_EQ(devices[1].path, "/dev/hidraw1");
    EXPECT_EQ(devices[1].productString, "USB Keyboard");
    EXPECT_TRUE(devices[1].manufacturerString.empty());
}

TEST(HidapiDeviceList, EmptyEnumerationYieldsNothing)
{
    EXPECT_TRUE(badgegate::device::hidapi::toDeviceInfos(nullptr).empty());
}

TEST(HidapiBackend, EnumerateWithoutReadersDoesNotThrow)
{
    const auto backend = badgegate::device::hidapi::makeHidapiBackend();
    EXPECT_NO_THROW((void)backend->enumerate());
}

TEST(HidapiBackend, OpenMissingNodeThrows)
{
    const auto backend = badgegate::device::hidapi::makeHidapiBackend();
    badgegate::device::HidDeviceInfo info{};
    info.path = "/nonexistent/badgegate/hidraw9";

    EXPECT_THROW((void)backend->open(info), badgegate::device::HidOpenError);
}

TEST(HidapiBackend, BackendsShareOneLibraryInstance)
{
    auto first = badgegate::device::hidapi::makeHidapiBackend();
    auto second = badgegate::device::hidapi::makeHidapiBackend();
    first.reset();

    badgegate::device::HidDeviceInfo info{};
    info.path = "/nonexistent/badgegate/hidraw9";
    EXPECT_NO_THROW((void)second->enumerate());
    EXPECT_THROW((void)second->open(info), badgegate::device::HidOpenError);
}
