#ifndef INCLUDE_BADGEGATE_DEVICE_SCANQUEUE_HPP
#define INCLUDE_BADGEGATE_DEVICE_SCANQUEUE_HPP

#include "badgegate/core/Clock.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace badgegate::device
{

constexpr std::size_t g_kDefaultScanQueueCapacity{ 10U };

struct CardScanEvent final
{
    std::string cardId;
    badgegate::core::TimePoint observedAt{};
};

// Bounded hand-off between the polling thread and consumers.
// When full, push() evicts the oldest event: the freshest scan is the one that matters at a kiosk.
class ScanQueue final
{
public:
    // Throws std::invalid_argument for a zero capacity.
    explicit ScanQueue(std::size_t capacity = g_kDefaultScanQueueCapacity);

    ScanQueue(const ScanQueue&) = delete;
    ScanQueue& operator=(const ScanQueue&) = delete;
    ScanQueue(ScanQueue&&) = delete;
    ScanQueue& operator=(ScanQueue&&) = delete;
    ~ScanQueue() = default;

    // Never blocks. Returns true when an older event had to be evicted.
    bool push(CardScanEvent event);

    [[nodiscard]] std::optional<CardScanEvent> pop(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<CardScanEvent> tryPop();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept;
    void clear();

private:
    const std::size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::deque<CardScanEvent> m_events;
};

} // namespace badgegate::device

#endif // INCLUDE_BADGEGATE_DEVICE_SCANQUEUE_HPP
