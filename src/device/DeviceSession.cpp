#include "badgegate/device/DeviceSession.hpp"

#include "badgegate/device/DuplicateSuppressor.hpp"
#include "badgegate/device/FrameDecoder.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <fmt/format.h>
#include <future>
#include <span>
#include <system_error>
#include <utility>

namespace badgegate::device
{

namespace
{

// How long the monitor thread blocks on the queue before re-checking its stop flag.
constexpr std::chrono::milliseconds g_kMonitorPollInterval{ 100 };

} // namespace

std::string_view stateName(DeviceState state) noexcept
{
    switch (state)
    {
    case DeviceState::Disconnected:
        return "disconnected";
    case DeviceState::Connecting:
        return "connecting";
    case DeviceState::Connected:
        return "connected";
    case DeviceState::Error:
        return "error";
    }
    return "unknown";
}

std::optional<HidDeviceInfo> selectReader(const std::vector<HidDeviceInfo>& devices,
                                          const badgegate::config::ReaderConfig& config)
{
    for (const auto& info : devices)
    {
        if (info.vendorId == config.vendorId && info.productId == config.productId)
        {
            return info;
        }
    }

    for (const auto& info : devices)
    {
        for (const auto& name : config.knownReaderNames)
        {
            if (!name.empty() && info.productString.find(name) != std::string::npos)
            {
                return info;
            }
        }
    }
    return std::nullopt;
}

std::string describeDevice(const HidDeviceInfo& info)
{
    return fmt::format("{:04X}:{:04X} {}", info.vendorId, info.productId, info.productString);
}

// Status shared between the caller threads and the background threads.
// The generation counter lets a poller that outlived its connection see that its failure is stale.
struct DeviceSession::StatusBoard final
{
    [[nodiscard]] DeviceStatus snapshot() const
    {
        std::lock_guard<std::mutex> lock{ mutex };
        return status;
    }

    void markConnecting()
    {
        std::lock_guard<std::mutex> lock{ mutex };
        status.state = DeviceState::Connecting;
        status.connected = false;
    }

    [[nodiscard]] std::uint64_t markConnected(std::string device)
    {
        std::lock_guard<std::mutex> lock{ mutex };
        status.state = DeviceState::Connected;
        status.connected = true;
        status.lastError.reset();
        status.device = std::move(device);
        return ++generation;
    }

    void markDisconnected(std::optional<std::string> error = std::nullopt)
    {
        std::lock_guard<std::mutex> lock{ mutex };
        ++generation;
        status.state = DeviceState::Disconnected;
        status.connected = false;
        status.device.clear();
        status.lastError = std::move(error);
    }

    // Applies only while the poller's connection is still the current one.
    [[nodiscard]] bool markFailed(std::uint64_t pollerGeneration, std::string error)
    {
        std::lock_guard<std::mutex> lock{ mutex };
        if (pollerGeneration != generation || status.state != DeviceState::Connected)
        {
            return false;
        }
        status.state = DeviceState::Error;
        status.connected = false;
        status.lastError = std::move(error);
        return true;
    }

    void setMonitoring(bool monitoring)
    {
        std::lock_guard<std::mutex> lock{ mutex };
        status.monitoring = monitoring;
    }

    void setCallback(StatusCallback callback)
    {
        std::lock_guard<std::mutex> lock{ mutex };
        onStatus = std::move(callback);
    }

    // Hands out the registered callback; the calling thread counts as inside it until release().
    [[nodiscard]] StatusCallback acquire()
    {
        std::lock_guard<std::mutex> lock{ mutex };
        if (!onStatus)
        {
            return {};
        }
        callers.push_back(std::this_thread::get_id());
        return onStatus;
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock{ mutex };
            const auto it = std::find(callers.begin(), callers.end(), std::this_thread::get_id());
            if (it != callers.end())
            {
                callers.erase(it);
            }
        }
        drained.notify_all();
    }

    // Blocks until no other thread is inside a callback handed out by acquire().
    // A thread that is itself inside one does not wait, so callbacks may stop or disconnect the session.
    void drain()
    {
        std::unique_lock<std::mutex> lock{ mutex };
        if (std::find(callers.begin(), callers.end(), std::this_thread::get_id()) != callers.end())
        {
            return;
        }
        drained.wait(lock, [this] { return callers.empty(); });
    }

    mutable std::mutex mutex;
    std::condition_variable drained;
    DeviceStatus status{};
    std::uint64_t generation{ 0 };
    StatusCallback onStatus;
    std::vector<std::thread::id> callers;
};

// Everything the polling thread touches. Owned jointly by the session and the thread so that a detached
// poller never reaches into a destroyed session. The thread closes the device on its way out.
struct DeviceSession::PollContext final
{
    PollContext(std::unique_ptr<IHidDevice> openDevice, const badgegate::config::ReaderConfig& config,
                const badgegate::log::Logger& logger, badgegate::core::NowProvider nowProvider,
                std::shared_ptr<ScanQueue> scanQueue, std::shared_ptr<StatusBoard> statusBoard,
                std::uint64_t pollerGeneration)
        : device(std::move(openDevice)), decoder(config.minTokenLength, config.maxBufferBytes, logger),
          suppressor(config.duplicateWindow), readTimeout(config.readTimeout),
          maxConsecutiveErrors(config.maxConsecutiveReadErrors), errorBackoff(config.errorBackoff), log(logger),
          now(std::move(nowProvider)), queue(std::move(scanQueue)), board(std::move(statusBoard)),
          generation(pollerGeneration), finishedFuture(finishedPromise.get_future())
    {
    }

    void closeDevice() noexcept
    {
        if (!closed.exchange(true))
        {
            device->close();
        }
    }

    std::unique_ptr<IHidDevice> device;
    FrameDecoder decoder;
    DuplicateSuppressor suppressor;
    std::chrono::milliseconds readTimeout;
    std::size_t maxConsecutiveErrors;
    std::chrono::milliseconds errorBackoff;
    badgegate::log::Logger log;
    badgegate::core::NowProvider now;
    std::shared_ptr<ScanQueue> queue;
    std::shared_ptr<StatusBoard> board;
    std::uint64_t generation;

    std::atomic<bool> stop{ false };
    std::atomic<bool> closed{ false };
    std::promise<void> finishedPromise;
    std::future<void> finishedFuture;
};

struct DeviceSession::MonitorContext final
{
    std::atomic<bool> stop{ false };
};

namespace
{

void invokeStatus(const DeviceSession::StatusCallback& callback, const DeviceStatus& status,
                  const badgegate::log::Logger& log) noexcept
{
    if (!callback)
    {
        return;
    }
    try
    {
        callback(status);
    }
    catch (const std::exception& e)
    {
        log.error("status callback failed: {}", e.what());
    }
}

// Waits up to `timeout` for a background thread to report completion.
// Returns true when the thread was joined, false when it had to be detached.
bool joinWithin(std::thread& thread, std::future<void>& finished, std::chrono::milliseconds timeout) noexcept
{
    if (!thread.joinable())
    {
        return true;
    }

    if (thread.get_id() == std::this_thread::get_id())
    {
        thread.detach();
        return false;
    }

    if (finished.wait_for(timeout) != std::future_status::ready)
    {
        thread.detach();
        return false;
    }

    try
    {
        thread.join();
    }
    catch (const std::system_error&)
    {
        thread.detach();
        return false;
    }
    return true;
}

// Unbounded join for threads that only ever wait on the scan queue or a user callback.
// A thread cannot join itself; it is detached and ends on its own once its stop flag is seen.
void joinOrDetach(std::thread& thread, const badgegate::log::Logger& log) noexcept
{
    if (!thread.joinable())
    {
        return;
    }

    if (thread.get_id() == std::this_thread::get_id())
    {
        thread.detach();
        return;
    }

    try
    {
        thread.join();
    }
    catch (const std::system_error& e)
    {
        log.warn("cannot join monitor thread: {}", e.what());
        thread.detach();
    }
}

template <class Context> void pollLoop(Context& ctx)
{
    std::size_t consecutiveErrors{ 0 };

    while (!ctx.stop.load())
    {
        std::vector<std::uint8_t> report{};
        try
        {
            report = ctx.device->read(ctx.readTimeout);
            consecutiveErrors = 0;
        }
        catch (const HidReadError& e)
        {
            ++consecutiveErrors;
            ctx.log.warn("read failed ({}/{}): {}", consecutiveErrors, ctx.maxConsecutiveErrors, e.what());
        }
        catch (const std::exception& e)
        {
            ++consecutiveErrors;
            ctx.log.warn("unexpected read failure ({}/{}): {}", consecutiveErrors, ctx.maxConsecutiveErrors,
                         e.what());
        }

        if (consecutiveErrors > 0U)
        {
            if (consecutiveErrors >= ctx.maxConsecutiveErrors)
            {
                const std::string message{ fmt::format("reader failed after {} consecutive read errors",
                                                       consecutiveErrors) };
                if (ctx.board->markFailed(ctx.generation, message))
                {
                    ctx.log.error("{}", message);
                    const auto callback = ctx.board->acquire();
                    if (callback)
                    {
                        invokeStatus(callback, ctx.board->snapshot(), ctx.log);
                        ctx.board->release();
                    }
                }
                return;
            }
            std::this_thread::sleep_for(ctx.errorBackoff);
            continue;
        }

        if (report.empty())
        {
            continue;
        }

        for (auto& token : ctx.decoder.feed(std::span<const std::uint8_t>{ report }))
        {
            const auto observedAt = ctx.now();
            if (!ctx.suppressor.accept(token, observedAt))
            {
                ctx.log.debug("duplicate scan suppressed: {}", badgegate::log::maskCardId(token));
                continue;
            }

            ctx.log.info("card scanned: {}", badgegate::log::maskCardId(token));
            if (ctx.queue->push(CardScanEvent{ std::move(token), observedAt }))
            {
                ctx.log.warn("scan queue full; oldest scan dropped");
            }
        }
    }
}

} // namespace

DeviceSession::DeviceSession(IHidBackend& backend, badgegate::config::ReaderConfig config,
                             const badgegate::log::Logger& logger, badgegate::core::NowProvider nowProvider)
    : m_backend(&backend), m_config(std::move(config)), m_log(logger.child("device")),
      m_now(std::move(nowProvider)), m_queue(std::make_shared<ScanQueue>(m_config.queueCapacity)),
      m_board(std::make_shared<StatusBoard>())
{
}

DeviceSession::~DeviceSession()
{
    disconnect();
}

DeviceResult<std::monostate> DeviceSession::connect()
{
    StatusCallback callback{};
    DeviceStatus after{};
    DeviceResult<std::monostate> result{ std::monostate{} };
    {
        std::lock_guard<std::mutex> lock{ m_lifecycleMutex };
        if (m_board->snapshot().state == DeviceState::Connected)
        {
            return std::monostate{};
        }

        // Leftovers of a connection that ended in Error.
        teardownPollerLocked();

        m_board->markConnecting();
        result = openLocked();
        callback = m_board->acquire();
        after = m_board->snapshot();
    }
    notify(callback, after);
    return result;
}

DeviceResult<std::monostate> DeviceSession::openLocked()
{
    std::vector<HidDeviceInfo> devices{};
    try
    {
        devices = m_backend->enumerate();
    }
    catch (const std::exception& e)
    {
        m_log.error("device enumeration failed: {}", e.what());
        m_board->markDisconnected(fmt::format("device enumeration failed: {}", e.what()));
        return DeviceError::DeviceUnavailable;
    }

    const auto match = selectReader(devices, m_config);
    if (!match.has_value())
    {
        m_log.error("no card reader found (expected {:04X}:{:04X})", m_config.vendorId, m_config.productId);
        for (const auto& info : devices)
        {
            m_log.info("  available: {} [{}]", describeDevice(info), info.path);
        }
        m_board->markDisconnected(std::string{ describe(DeviceError::DeviceUnavailable) });
        return DeviceError::DeviceUnavailable;
    }

    std::unique_ptr<IHidDevice> device{};
    try
    {
        device = m_backend->open(*match);
    }
    catch (const HidOpenError& e)
    {
        m_log.error("cannot open {}: {}", describeDevice(*match), e.what());
        m_board->markDisconnected(e.what());
        return DeviceError::ConnectionFailed;
    }
    catch (const std::exception& e)
    {
        m_log.error("unexpected error opening {}: {}", describeDevice(*match), e.what());
        m_board->markDisconnected(e.what());
        return DeviceError::ConnectionFailed;
    }

    if (!device)
    {
        m_board->markDisconnected(std::string{ describe(DeviceError::ConnectionFailed) });
        return DeviceError::ConnectionFailed;
    }

    const auto generation = m_board->markConnected(describeDevice(*match));
    auto context = std::make_shared<PollContext>(std::move(device), m_config, m_log, m_now, m_queue, m_board,
                                                 generation);
    try
    {
        m_poller = std::thread{ [context] {
            pollLoop(*context);
            // The handle is only ever closed by the thread that reads from it.
            context->closeDevice();
            context->finishedPromise.set_value();
        } };
    }
    catch (const std::system_error& e)
    {
        m_log.error("cannot start polling thread: {}", e.what());
        context->closeDevice();
        m_board->markDisconnected(e.what());
        return DeviceError::ConnectionFailed;
    }

    m_poll = std::move(context);
    m_log.info("connected to {} [{}]", describeDevice(*match), match->path);
    return std::monostate{};
}

void DeviceSession::teardownPollerLocked() noexcept
{
    if (!m_poll)
    {
        return;
    }

    m_poll->stop.store(true);
    if (!joinWithin(m_poller, m_poll->finishedFuture, m_config.joinTimeout))
    {
        // The detached poller closes the handle once its pending read returns.
        m_log.warn("polling thread did not stop within {} ms; detached", m_config.joinTimeout.count());
    }
    m_poll.reset();
}

void DeviceSession::disconnect() noexcept
{
    StatusCallback callback{};
    DeviceStatus after{};
    std::thread retiredMonitor{};
    {
        std::lock_guard<std::mutex> lock{ m_lifecycleMutex };
        if (!m_poll && !m_monitor && m_board->snapshot().state == DeviceState::Disconnected)
        {
            return;
        }

        // Taken before the monitor deregisters it: the disconnect itself is still reported.
        callback = m_board->acquire();
        (void)stopMonitorLocked(retiredMonitor);
        teardownPollerLocked();
        m_queue->clear();
        m_board->markDisconnected();
        after = m_board->snapshot();
        m_log.info("disconnected");
    }
    joinOrDetach(retiredMonitor, m_log);
    notify(callback, after);
    m_board->drain();
}

std::optional<std::string> DeviceSession::readCard(std::chrono::milliseconds timeout)
{
    if (m_board->snapshot().state == DeviceState::Disconnected)
    {
        return std::nullopt;
    }

    auto event = m_queue->pop(timeout);
    if (!event.has_value())
    {
        return std::nullopt;
    }
    return std::move(event->cardId);
}

std::optional<std::string> DeviceSession::tryReadCard()
{
    auto event = m_queue->tryPop();
    if (!event.has_value())
    {
        return std::nullopt;
    }
    return std::move(event->cardId);
}

bool DeviceSession::startMonitoring(CardCallback onCard, StatusCallback onStatus)
{
    if (!onCard)
    {
        return false;
    }

    StatusCallback callback{};
    DeviceStatus after{};
    {
        std::lock_guard<std::mutex> lock{ m_lifecycleMutex };
        if (m_monitor || m_board->snapshot().state != DeviceState::Connected)
        {
            return false;
        }

        auto context = std::make_shared<MonitorContext>();
        auto queue = m_queue;
        auto log = m_log;
        try
        {
            m_monitorThread = std::thread{ [context, queue, log, handler = std::move(onCard)] {
                while (!context->stop.load())
                {
                    auto event = queue->pop(g_kMonitorPollInterval);
                    if (!event.has_value() || context->stop.load())
                    {
                        continue;
                    }
                    try
                    {
                        handler(event->cardId);
                    }
                    catch (const std::exception& e)
                    {
                        log.error("card callback failed: {}", e.what());
                    }
                }
            } };
        }
        catch (const std::system_error& e)
        {
            m_log.error("cannot start monitor thread: {}", e.what());
            return false;
        }

        m_monitor = std::move(context);
        m_board->setCallback(std::move(onStatus));
        m_board->setMonitoring(true);
        callback = m_board->acquire();
        after = m_board->snapshot();
        m_log.info("monitoring started");
    }
    notify(callback, after);
    return true;
}

// Deregisters the callbacks and hands the monitor thread to the caller, who joins it after releasing
// the lifecycle lock so that a card callback blocked on that lock can finish.
bool DeviceSession::stopMonitorLocked(std::thread& retired) noexcept
{
    if (!m_monitor)
    {
        return false;
    }

    m_monitor->stop.store(true);
    retired = std::move(m_monitorThread);
    m_monitor.reset();
    m_board->setMonitoring(false);
    m_board->setCallback({});
    m_log.info("monitoring stopped");
    return true;
}

void DeviceSession::stopMonitoring() noexcept
{
    std::thread retired{};
    {
        std::lock_guard<std::mutex> lock{ m_lifecycleMutex };
        if (!stopMonitorLocked(retired))
        {
            return;
        }
    }
    joinOrDetach(retired, m_log);
    m_board->drain();
}

DeviceStatus DeviceSession::status() const
{
    return m_board->snapshot();
}

std::vector<HidDeviceInfo> DeviceSession::listDevices() const
{
    try
    {
        return m_backend->enumerate();
    }
    catch (const std::exception& e)
    {
        m_log.error("device enumeration failed: {}", e.what());
        return {};
    }
}

void DeviceSession::notify(const StatusCallback& callback, const DeviceStatus& status) const noexcept
{
    if (!callback)
    {
        return;
    }
    invokeStatus(callback, status, m_log);
    m_board->release();
}

} // namespace badgegate::device
