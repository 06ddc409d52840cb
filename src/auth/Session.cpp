#include "badgegate/auth/Session.hpp"

#include <utility>

namespace badgegate::auth
{

std::string_view sessionStateName(SessionState state) noexcept
{
    switch (state)
    {
    case SessionState::None:
        return "none";
    case SessionState::Active:
        return "active";
    case SessionState::Expired:
        return "expired";
    case SessionState::Closed:
        return "closed";
    }
    return "unknown";
}

Session::Session(EmployeeRecord employee, Duration timeout, badgegate::core::NowProvider nowProvider)
    : m_now(std::move(nowProvider)), m_timeout(timeout), m_employee(std::move(employee))
{
    m_startedAt = m_now();
    m_lastActivity = m_startedAt;
}

void Session::touch()
{
    if (m_state == SessionState::Active)
    {
        m_lastActivity = m_now();
    }
}

bool Session::isExpired() const
{
    if (m_state == SessionState::Expired)
    {
        return true;
    }
    if (m_state != SessionState::Active || m_timeout.count() <= 0)
    {
        return false;
    }

    return (m_now() - m_lastActivity) > m_timeout;
}

void Session::markExpired() noexcept
{
    if (m_state == SessionState::Active)
    {
        m_state = SessionState::Expired;
    }
}

void Session::close() noexcept
{
    m_state = SessionState::Closed;
}

SessionState Session::state() const noexcept
{
    return m_state;
}

const EmployeeRecord& Session::employee() const noexcept
{
    return m_employee;
}

Session::Duration Session::timeout() const noexcept
{
    return m_timeout;
}

badgegate::core::TimePoint Session::startedAt() const noexcept
{
    return m_startedAt;
}

badgegate::core::TimePoint Session::lastActivity() const noexcept
{
    return m_lastActivity;
}

std::chrono::seconds Session::duration() const
{
    return std::chrono::duration_cast<std::chrono::seconds>(m_now() - m_startedAt);
}

} // namespace badgegate::auth
