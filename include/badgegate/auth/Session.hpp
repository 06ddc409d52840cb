#ifndef INCLUDE_BADGEGATE_AUTH_SESSION_HPP
#define INCLUDE_BADGEGATE_AUTH_SESSION_HPP

#include "badgegate/auth/Employee.hpp"
#include "badgegate/core/Clock.hpp"
#include <chrono>
#include <cstdint>
#include <string_view>

namespace badgegate::auth
{

enum class SessionState : std::uint8_t
{
    None,
    Active,
    Expired,
    Closed,
};

[[nodiscard]] std::string_view sessionStateName(SessionState state) noexcept;

// Login of one employee at the kiosk. Expiry is detected lazily: isExpired() compares the idle time with
// the timeout on every call, nothing runs in the background.
class Session final
{
public:
    using Duration = std::chrono::minutes;

    Session(EmployeeRecord employee, Duration timeout,
            badgegate::core::NowProvider nowProvider = badgegate::core::Clock::now);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) noexcept = default;
    Session& operator=(Session&&) noexcept = default;
    ~Session() = default;

    // Refreshes the idle timer of an Active session; no effect otherwise.
    void touch();

    // A zero timeout disables expiry.
    [[nodiscard]] bool isExpired() const;

    void markExpired() noexcept;
    void close() noexcept;

    [[nodiscard]] SessionState state() const noexcept;
    [[nodiscard]] const EmployeeRecord& employee() const noexcept;
    [[nodiscard]] Duration timeout() const noexcept;
    [[nodiscard]] badgegate::core::TimePoint startedAt() const noexcept;
    [[nodiscard]] badgegate::core::TimePoint lastActivity() const noexcept;
    [[nodiscard]] std::chrono::seconds duration() const;

private:
    badgegate::core::NowProvider m_now;
    Duration m_timeout{};
    badgegate::core::TimePoint m_startedAt{};
    badgegate::core::TimePoint m_lastActivity{};
    SessionState m_state{ SessionState::Active };
    EmployeeRecord m_employee;
};

} // namespace badgegate::auth

#endif // INCLUDE_BADGEGATE_AUTH_SESSION_HPP
