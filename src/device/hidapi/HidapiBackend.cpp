#include "badgegate/device/hidapi/HidapiBackendFactory.hpp"

#include "badgegate/device/DeviceErrors.hpp"
#include "badgegate/device/hidapi/HidapiDeviceList.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <hidapi.h>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace badgegate::device::hidapi
{
namespace
{

// Largest input report of the supported readers.
constexpr std::size_t g_kReportBytes{ 64U };

// hid_init()/hid_exit() pair. Shared by every backend and open device of the process, so hid_exit()
// only runs once the last handle is gone.
class HidapiLibrary final
{
public:
    HidapiLibrary()
    {
        if (::hid_init() != 0)
        {
            throw badgegate::device::HidOpenError("hidapi initialisation failed");
        }
    }

    HidapiLibrary(const HidapiLibrary&) = delete;
    HidapiLibrary& operator=(const HidapiLibrary&) = delete;
    HidapiLibrary(HidapiLibrary&&) = delete;
    HidapiLibrary& operator=(HidapiLibrary&&) = delete;

    ~HidapiLibrary()
    {
        (void)::hid_exit();
    }
};

[[nodiscard]] std::shared_ptr<HidapiLibrary> sharedLibrary()
{
    static std::mutex mutex;
    static std::weak_ptr<HidapiLibrary> current;

    std::lock_guard<std::mutex> lock{ mutex };
    auto library = current.lock();
    if (!library)
    {
        library = std::make_shared<HidapiLibrary>();
        current = library;
    }
    return library;
}

struct EnumerationDeleter
{
    void operator()(hid_device_info* head) const noexcept
    {
        ::hid_free_enumeration(head);
    }
};
using EnumerationPtr = std::unique_ptr<hid_device_info, EnumerationDeleter>;

[[nodiscard]] std::string lastError(hid_device* handle, const char* fallback)
{
    auto message = narrowHidString(::hid_error(handle));
    return message.empty() ? std::string{ fallback } : message;
}

class HidapiDevice final : public badgegate::device::IHidDevice
{
public:
    HidapiDevice(hid_device* handle, std::string path, std::shared_ptr<HidapiLibrary> library) noexcept
        : m_handle(handle), m_path(std::move(path)), m_library(std::move(library))
    {
    }

    HidapiDevice(const HidapiDevice&) = delete;
    HidapiDevice& operator=(const HidapiDevice&) = delete;
    HidapiDevice(HidapiDevice&&) = delete;
    HidapiDevice& operator=(HidapiDevice&&) = delete;

    ~HidapiDevice() override
    {
        close();
    }

    [[nodiscard]] std::vector<std::uint8_t> read(std::chrono::milliseconds timeout) override
    {
        hid_device* handle{ m_handle.load() };
        if (handle == nullptr)
        {
            throw badgegate::device::HidReadError(m_path + ": device closed");
        }

        std::vector<std::uint8_t> report(g_kReportBytes);
        const int got{ ::hid_read_timeout(handle, report.data(), report.size(), static_cast<int>(timeout.count())) };
        if (got < 0)
        {
            throw badgegate::device::HidReadError(m_path + ": " + lastError(handle, "read failed"));
        }

        report.resize(static_cast<std::size_t>(got));
        return report;
    }

    void close() noexcept override
    {
        hid_device* handle{ m_handle.exchange(nullptr) };
        if (handle != nullptr)
        {
            ::hid_close(handle);
        }
    }

private:
    std::atomic<hid_device*> m_handle;
    std::string m_path;
    std::shared_ptr<HidapiLibrary> m_library;
};

class HidapiBackend final : public badgegate::device::IHidBackend
{
public:
    HidapiBackend() : m_library(sharedLibrary())
    {
    }

    [[nodiscard]] std::vector<HidDeviceInfo> enumerate() const override
    {
        // 0/0 matches every vendor and product.
        const EnumerationPtr head{ ::hid_enumerate(0U, 0U) };
        return toDeviceInfos(head.get());
    }

    [[nodiscard]] std::unique_ptr<IHidDevice> open(const HidDeviceInfo& info) override
    {
        hid_device* handle{ ::hid_open_path(info.path.c_str()) };
        if (handle == nullptr)
        {
            throw badgegate::device::HidOpenError(info.path + ": " + lastError(nullptr, "cannot open device"));
        }

        if (::hid_set_nonblocking(handle, 1) != 0)
        {
            auto message = lastError(handle, "cannot switch to non-blocking mode");
            ::hid_close(handle);
            throw badgegate::device::HidOpenError(info.path + ": " + message);
        }
        return std::make_unique<HidapiDevice>(handle, info.path, m_library);
    }

private:
    std::shared_ptr<HidapiLibrary> m_library;
};

} // namespace

[[nodiscard]] std::unique_ptr<badgegate::device::IHidBackend> makeHidapiBackend()
{
    return std::make_unique<HidapiBackend>();
}

} // namespace badgegate::device::hidapi
