#include "badgegate/auth/AuthenticationService.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

namespace badgegate::auth
{

namespace
{

constexpr std::string_view g_kCardChannel{ "card" };
constexpr std::string_view g_kManualChannel{ "manual" };

// Card ids are credentials; display names are not.
[[nodiscard]] std::string loggable(std::string_view identifier, std::string_view channel)
{
    return channel == g_kCardChannel ? badgegate::log::maskCardId(identifier) : std::string{ identifier };
}

} // namespace

AuthenticationService::AuthenticationService(IEmployeeDirectory& directory, badgegate::config::AuthPolicy policy,
                                             const badgegate::log::Logger& logger,
                                             badgegate::core::NowProvider nowProvider)
    : m_directory(&directory), m_policy(policy), m_log(logger.child("auth")), m_now(std::move(nowProvider))
{
}

AuthResult AuthenticationService::authenticate(std::string_view cardId)
{
    return authenticateWith(cardId, &IEmployeeDirectory::lookupEmployee, g_kCardChannel);
}

AuthResult AuthenticationService::authenticateManual(std::string_view displayName)
{
    return authenticateWith(displayName, &IEmployeeDirectory::lookupByDisplayName, g_kManualChannel);
}

AuthResult AuthenticationService::authenticateWith(std::string_view identifier, Lookup lookup,
                                                   std::string_view channel)
{
    if (identifier.empty())
    {
        m_log.warn("empty {} identifier rejected", channel);
        return AuthError::Unauthorized;
    }

    std::lock_guard<std::mutex> lock{ m_mutex };
    const auto now = m_now();
    const std::string who{ loggable(identifier, channel) };

    if (pruneFailuresLocked(identifier, now) >= m_policy.maxAttempts)
    {
        m_log.warn("{} {} locked, {} min remaining", channel, who, remainingLockoutLocked(identifier, now).count());
        return AuthError::Locked;
    }

    std::optional<EmployeeRecord> employee{};
    try
    {
        employee = (m_directory->*lookup)(identifier);
    }
    catch (const std::exception& e)
    {
        m_log.error("directory lookup for {} {} failed: {}", channel, who, e.what());
        return AuthError::DirectoryUnavailable;
    }

    if (!employee.has_value() || !employee->active)
    {
        auto& failures = m_failures.try_emplace(std::string{ identifier }).first->second;
        failures.push_back(now);
        if (employee.has_value())
        {
            m_log.warn("{} login for inactive employee {} rejected ({}/{})", channel, employee->displayName,
                       failures.size(), m_policy.maxAttempts);
        }
        else
        {
            m_log.warn("unknown {} {} ({}/{})", channel, who, failures.size(), m_policy.maxAttempts);
        }
        return AuthError::Unauthorized;
    }

    if (const auto it = m_failures.find(identifier); it != m_failures.end())
    {
        m_failures.erase(it);
    }

    if (m_session.has_value())
    {
        m_log.info("session of {} replaced", m_session->employee().displayName);
        endSessionLocked(SessionState::Closed);
    }
    m_session.emplace(*employee, m_policy.sessionTimeout, m_now);

    try
    {
        m_directory->recordLastLogin(employee->id);
    }
    catch (const std::exception& e)
    {
        m_log.error("cannot record last login of {}: {}", employee->displayName, e.what());
    }
    notifyClockEventLocked(employee->id, ClockEventKind::In);

    m_log.info("{} login: {} ({})", channel, employee->displayName, roleName(employee->role));
    return *std::move(employee);
}

std::optional<EmployeeRecord> AuthenticationService::getCurrentUser()
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    if (!refreshSessionLocked())
    {
        return std::nullopt;
    }
    return m_session->employee();
}

bool AuthenticationService::isAuthenticated()
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    return refreshSessionLocked();
}

void AuthenticationService::updateActivity()
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    if (refreshSessionLocked())
    {
        m_session->touch();
    }
}

bool AuthenticationService::hasPermission(std::string_view permission)
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    if (!refreshSessionLocked())
    {
        return false;
    }
    m_session->touch();
    return grantsPermission(m_session->employee(), permission);
}

std::vector<std::string> AuthenticationService::currentPermissions()
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    if (!refreshSessionLocked())
    {
        return {};
    }
    const auto& permissions = m_session->employee().permissions;
    return std::vector<std::string>(permissions.begin(), permissions.end());
}

void AuthenticationService::logout()
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    if (!m_session.has_value())
    {
        return;
    }
    m_log.info("logout: {}", m_session->employee().displayName);
    endSessionLocked(SessionState::Closed);
}

std::chrono::minutes AuthenticationService::remainingLockout(std::string_view identifier)
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    return remainingLockoutLocked(identifier, m_now());
}

UnlockResult AuthenticationService::unlockAccount(std::string_view identifier)
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    if (!refreshSessionLocked() || !grantsPermission(m_session->employee(), g_kManageUsersPermission))
    {
        m_log.warn("unlock of {} denied", badgegate::log::maskCardId(identifier));
        return UnlockResult::PermissionDenied;
    }
    m_session->touch();

    const bool locked{ pruneFailuresLocked(identifier, m_now()) >= m_policy.maxAttempts };
    if (const auto it = m_failures.find(identifier); it != m_failures.end())
    {
        m_failures.erase(it);
    }
    if (!locked)
    {
        return UnlockResult::NotLocked;
    }

    m_log.info("{} unlocked {}", m_session->employee().displayName, badgegate::log::maskCardId(identifier));
    return UnlockResult::Unlocked;
}

LoginStatistics AuthenticationService::loginStatistics()
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    LoginStatistics out{};
    if (refreshSessionLocked())
    {
        out.currentUser = m_session->employee().displayName;
        out.authenticated = true;
        out.sessionDuration = m_session->duration();
    }

    pruneAllLocked(m_now());
    for (const auto& [identifier, failures] : m_failures)
    {
        out.failedAttempts += failures.size();
        if (failures.size() >= m_policy.maxAttempts)
        {
            out.lockedIdentifiers.push_back(identifier);
        }
    }
    return out;
}

SessionState AuthenticationService::sessionState() const
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    return m_session.has_value() ? m_session->state() : SessionState::None;
}

const badgegate::config::AuthPolicy& AuthenticationService::policy() const noexcept
{
    return m_policy;
}

std::size_t AuthenticationService::pruneFailuresLocked(std::string_view identifier, badgegate::core::TimePoint now)
{
    const auto it = m_failures.find(identifier);
    if (it == m_failures.end())
    {
        return 0U;
    }

    std::erase_if(it->second, [&](badgegate::core::TimePoint at) { return (now - at) >= m_policy.lockoutWindow; });
    if (it->second.empty())
    {
        m_failures.erase(it);
        return 0U;
    }
    return it->second.size();
}

void AuthenticationService::pruneAllLocked(badgegate::core::TimePoint now)
{
    for (auto it = m_failures.begin(); it != m_failures.end();)
    {
        std::erase_if(it->second,
                      [&](badgegate::core::TimePoint at) { return (now - at) >= m_policy.lockoutWindow; });
        it = it->second.empty() ? m_failures.erase(it) : std::next(it);
    }
}

std::chrono::minutes AuthenticationService::remainingLockoutLocked(std::string_view identifier,
                                                                   badgegate::core::TimePoint now)
{
    if (pruneFailuresLocked(identifier, now) < m_policy.maxAttempts)
    {
        return std::chrono::minutes{ 0 };
    }

    const auto& failures = m_failures.find(identifier)->second;
    const auto oldest = *std::min_element(failures.begin(), failures.end());
    const auto remaining = m_policy.lockoutWindow - (now - oldest);
    return std::max(std::chrono::duration_cast<std::chrono::minutes>(remaining), std::chrono::minutes{ 0 });
}

bool AuthenticationService::refreshSessionLocked()
{
    if (!m_session.has_value())
    {
        return false;
    }
    if (m_session->state() != SessionState::Active)
    {
        m_session.reset();
        return false;
    }
    if (m_session->isExpired())
    {
        m_log.info("session of {} expired after {} min idle", m_session->employee().displayName,
                   m_policy.sessionTimeout.count());
        endSessionLocked(SessionState::Expired);
        return false;
    }
    return true;
}

void AuthenticationService::endSessionLocked(SessionState terminal)
{
    if (!m_session.has_value())
    {
        return;
    }

    const bool wasActive{ m_session->state() == SessionState::Active };
    const auto employeeId = m_session->employee().id;
    if (terminal == SessionState::Expired)
    {
        m_session->markExpired();
    }
    else
    {
        m_session->close();
    }

    if (wasActive)
    {
        notifyClockEventLocked(employeeId, ClockEventKind::Out);
    }
    m_session.reset();
}

void AuthenticationService::notifyClockEventLocked(std::int64_t employeeId, ClockEventKind kind) noexcept
{
    try
    {
        m_directory->recordClockEvent(employeeId, kind);
    }
    catch (const std::exception& e)
    {
        m_log.error("cannot record clock-{} of employee {}: {}", clockEventName(kind), employeeId, e.what());
    }
}

} // namespace badgegate::auth
