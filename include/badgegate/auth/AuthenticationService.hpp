#ifndef INCLUDE_BADGEGATE_AUTH_AUTHENTICATIONSERVICE_HPP
#define INCLUDE_BADGEGATE_AUTH_AUTHENTICATIONSERVICE_HPP

#include "badgegate/auth/Employee.hpp"
#include "badgegate/auth/IEmployeeDirectory.hpp"
#include "badgegate/auth/Session.hpp"
#include "badgegate/config/KioskConfig.hpp"
#include "badgegate/core/Clock.hpp"
#include "badgegate/log/Logger.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace badgegate::auth
{

enum class AuthError : std::uint8_t
{
    Unauthorized,
    Locked,
    DirectoryUnavailable,
};

using AuthResult = std::variant<EmployeeRecord, AuthError>;

[[nodiscard]] constexpr std::string_view describe(AuthError error) noexcept
{
    switch (error)
    {
    case AuthError::Unauthorized:
        return "unknown or inactive identifier";
    case AuthError::Locked:
        return "too many failed attempts; identifier locked";
    case AuthError::DirectoryUnavailable:
        return "employee directory unavailable";
    }
    return "unknown authentication error";
}

enum class UnlockResult : std::uint8_t
{
    Unlocked,
    NotLocked,
    PermissionDenied,
};

struct LoginStatistics final
{
    std::optional<std::string> currentUser;
    bool authenticated{ false };
    std::chrono::seconds sessionDuration{};
    // Failures still inside the lockout window, over all identifiers.
    std::size_t failedAttempts{};
    std::vector<std::string> lockedIdentifiers;
};

// Owns the single login session of the kiosk and the failed-attempt history used for lockout.
// Every outcome is a value; directory exceptions are caught here and never reach the caller.
class AuthenticationService final
{
public:
    AuthenticationService(IEmployeeDirectory& directory,
                          badgegate::config::AuthPolicy policy = badgegate::config::defaultAuthPolicy(),
                          const badgegate::log::Logger& logger = badgegate::log::nullLogger(),
                          badgegate::core::NowProvider nowProvider = badgegate::core::Clock::now);

    AuthenticationService(const AuthenticationService&) = delete;
    AuthenticationService& operator=(const AuthenticationService&) = delete;
    AuthenticationService(AuthenticationService&&) = delete;
    AuthenticationService& operator=(AuthenticationService&&) = delete;
    ~AuthenticationService() = default;

    // Card scan. A success replaces any current session.
    [[nodiscard]] AuthResult authenticate(std::string_view cardId);
    // Manual fallback keyed by display name; same lockout policy as card scans.
    [[nodiscard]] AuthResult authenticateManual(std::string_view displayName);

    [[nodiscard]] std::optional<EmployeeRecord> getCurrentUser();
    [[nodiscard]] bool isAuthenticated();
    void updateActivity();
    [[nodiscard]] bool hasPermission(std::string_view permission);
    [[nodiscard]] std::vector<std::string> currentPermissions();
    void logout();

    [[nodiscard]] std::chrono::minutes remainingLockout(std::string_view identifier);
    [[nodiscard]] UnlockResult unlockAccount(std::string_view identifier);
    [[nodiscard]] LoginStatistics loginStatistics();

    [[nodiscard]] SessionState sessionState() const;
    [[nodiscard]] const badgegate::config::AuthPolicy& policy() const noexcept;

private:
    using Lookup = std::optional<EmployeeRecord> (IEmployeeDirectory::*)(std::string_view);
    using FailureHistory = std::map<std::string, std::vector<badgegate::core::TimePoint>, std::less<>>;

    [[nodiscard]] AuthResult authenticateWith(std::string_view identifier, Lookup lookup, std::string_view channel);

    [[nodiscard]] std::size_t pruneFailuresLocked(std::string_view identifier, badgegate::core::TimePoint now);
    void pruneAllLocked(badgegate::core::TimePoint now);
    [[nodiscard]] std::chrono::minutes remainingLockoutLocked(std::string_view identifier,
                                                              badgegate::core::TimePoint now);

    // Expires an idle session; returns true while an Active session remains.
    [[nodiscard]] bool refreshSessionLocked();
    void endSessionLocked(SessionState terminal);
    void notifyClockEventLocked(std::int64_t employeeId, ClockEventKind kind) noexcept;

    IEmployeeDirectory* m_directory{ nullptr };
    badgegate::config::AuthPolicy m_policy;
    badgegate::log::Logger m_log;
    badgegate::core::NowProvider m_now;

    mutable std::mutex m_mutex;
    std::optional<Session> m_session;
    FailureHistory m_failures;
};

} // namespace badgegate::auth

#endif // INCLUDE_BADGEGATE_AUTH_AUTHENTICATIONSERVICE_HPP
