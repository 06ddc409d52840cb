#include "badgegate/device/ScanQueue.hpp"

#include <stdexcept>

namespace badgegate::device
{

ScanQueue::ScanQueue(std::size_t capacity) : m_capacity(capacity)
{
    if (m_capacity == 0U)
    {
        throw std::invalid_argument("ScanQueue: capacity must be positive");
    }
}

bool ScanQueue::push(CardScanEvent event)
{
    bool evicted{ false };
    {
        std::lock_guard<std::mutex> lock{ m_mutex };
        if (m_events.size() >= m_capacity)
        {
            m_events.pop_front();
            evicted = true;
        }
        m_events.push_back(std::move(event));
    }
    m_notEmpty.notify_one();
    return evicted;
}

std::optional<CardScanEvent> ScanQueue::pop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock{ m_mutex };
    if (!m_notEmpty.wait_for(lock, timeout, [this] { return !m_events.empty(); }))
    {
        return std::nullopt;
    }

    CardScanEvent out{ std::move(m_events.front()) };
    m_events.pop_front();
    return out;
}

std::optional<CardScanEvent> ScanQueue::tryPop()
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    if (m_events.empty())
    {
        return std::nullopt;
    }

    CardScanEvent out{ std::move(m_events.front()) };
    m_events.pop_front();
    return out;
}

std::size_t ScanQueue::size() const
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    return m_events.size();
}

std::size_t ScanQueue::capacity() const noexcept
{
    return m_capacity;
}

void ScanQueue::clear()
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    m_events.clear();
}

} // namespace badgegate::device
