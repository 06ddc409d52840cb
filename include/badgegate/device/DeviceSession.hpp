#ifndef INCLUDE_BADGEGATE_DEVICE_DEVICESESSION_HPP
#define INCLUDE_BADGEGATE_DEVICE_DEVICESESSION_HPP

#include "badgegate/config/KioskConfig.hpp"
#include "badgegate/core/Clock.hpp"
#include "badgegate/device/DeviceErrors.hpp"
#include "badgegate/device/IHidDevice.hpp"
#include "badgegate/device/ScanQueue.hpp"
#include "badgegate/log/Logger.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

namespace badgegate::device
{

enum class DeviceState : std::uint8_t
{
    Disconnected,
    Connecting,
    Connected,
    Error,
};

[[nodiscard]] std::string_view stateName(DeviceState state) noexcept;

struct DeviceStatus final
{
    DeviceState state{ DeviceState::Disconnected };
    bool connected{ false };
    bool monitoring{ false };
    std::optional<std::string> lastError;
    // "VID:PID product" of the open reader; empty while disconnected.
    std::string device;
};

// Exact vendor/product pair first, then a substring match of the product string against the known names.
[[nodiscard]] std::optional<HidDeviceInfo> selectReader(const std::vector<HidDeviceInfo>& devices,
                                                        const badgegate::config::ReaderConfig& config);

[[nodiscard]] std::string describeDevice(const HidDeviceInfo& info);

// Owns the reader handle and its polling thread:
//   device -> FrameDecoder -> DuplicateSuppressor -> ScanQueue -> readCard() / monitor callback.
// All public operations are safe to call from any thread, including from inside a monitor callback.
class DeviceSession final
{
public:
    using CardCallback = std::function<void(const std::string& cardId)>;
    using StatusCallback = std::function<void(const DeviceStatus& status)>;

    DeviceSession(IHidBackend& backend, badgegate::config::ReaderConfig config,
                  const badgegate::log::Logger& logger = badgegate::log::nullLogger(),
                  badgegate::core::NowProvider nowProvider = badgegate::core::Clock::now);

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;
    DeviceSession(DeviceSession&&) = delete;
    DeviceSession& operator=(DeviceSession&&) = delete;
    ~DeviceSession();

    // No-op success when already connected. Reconnecting from Error keeps an active monitor running.
    [[nodiscard]] DeviceResult<std::monostate> connect();

    // Idempotent. Joins the poller for at most ReaderConfig::joinTimeout; a poller stuck in an unresponsive
    // device is detached and closes the handle itself once its read returns. Clears lastError.
    // Stops monitoring as stopMonitoring() does, after reporting the disconnect to `onStatus`.
    void disconnect() noexcept;

    [[nodiscard]] std::optional<std::string> readCard(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<std::string> tryReadCard();

    // Starts a consumer thread that hands every queued card to `onCard`. `onStatus` is invoked after each
    // status change until stopMonitoring(). Returns false when not connected or already monitoring.
    bool startMonitoring(CardCallback onCard, StatusCallback onStatus = {});

    // Deregisters both callbacks without reporting a status change. On return neither callback is running
    // and neither will run again, unless the caller is itself inside one of them.
    void stopMonitoring() noexcept;

    [[nodiscard]] DeviceStatus status() const;

    // Diagnostics: every HID device the backend can see.
    [[nodiscard]] std::vector<HidDeviceInfo> listDevices() const;

private:
    struct StatusBoard;
    struct PollContext;
    struct MonitorContext;

    [[nodiscard]] DeviceResult<std::monostate> openLocked();
    void teardownPollerLocked() noexcept;
    [[nodiscard]] bool stopMonitorLocked(std::thread& retired) noexcept;
    void notify(const StatusCallback& callback, const DeviceStatus& status) const noexcept;

    IHidBackend* m_backend{ nullptr };
    badgegate::config::ReaderConfig m_config;
    badgegate::log::Logger m_log;
    badgegate::core::NowProvider m_now;

    std::shared_ptr<ScanQueue> m_queue;
    std::shared_ptr<StatusBoard> m_board;

    std::mutex m_lifecycleMutex;
    std::shared_ptr<PollContext> m_poll;
    std::thread m_poller;
    std::shared_ptr<MonitorContext> m_monitor;
    std::thread m_monitorThread;
};

} // namespace badgegate::device

#endif // INCLUDE_BADGEGATE_DEVICE_DEVICESESSION_HPP
