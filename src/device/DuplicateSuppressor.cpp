#include "badgegate/device/DuplicateSuppressor.hpp"

namespace badgegate::device
{

DuplicateSuppressor::DuplicateSuppressor(std::chrono::milliseconds window) noexcept : m_window(window)
{
}

bool DuplicateSuppressor::accept(std::string_view token, badgegate::core::TimePoint now)
{
    if (m_lastToken.has_value() && *m_lastToken == token && (now - m_lastTime) < m_window)
    {
        return false;
    }

    m_lastToken = std::string{ token };
    m_lastTime = now;
    return true;
}

void DuplicateSuppressor::reset() noexcept
{
    m_lastToken.reset();
    m_lastTime = {};
}

std::chrono::milliseconds DuplicateSuppressor::window() const noexcept
{
    return m_window;
}

} // namespace badgegate::device
