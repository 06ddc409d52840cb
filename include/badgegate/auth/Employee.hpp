#ifndef INCLUDE_BADGEGATE_AUTH_EMPLOYEE_HPP
#define INCLUDE_BADGEGATE_AUTH_EMPLOYEE_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace badgegate::auth
{

// Grants every permission.
inline constexpr std::string_view g_kWildcardPermission{ "*" };
// Required to lift another identifier's lockout.
inline constexpr std::string_view g_kManageUsersPermission{ "manage_users" };

using PermissionSet = std::set<std::string, std::less<>>;

enum class Role : std::uint8_t
{
    Worker,
    Supervisor,
    Manager,
    Admin,
};

[[nodiscard]] std::string_view roleName(Role role) noexcept;
[[nodiscard]] std::optional<Role> roleFromString(std::string_view name) noexcept;

// Applied when a directory row carries no explicit permissions.
[[nodiscard]] PermissionSet defaultPermissionsFor(Role role);

struct EmployeeRecord final
{
    std::int64_t id{};
    std::string displayName;
    Role role{ Role::Worker };
    PermissionSet permissions;
    bool active{ true };
    std::string language{ "de" };

    friend bool operator==(const EmployeeRecord&, const EmployeeRecord&) = default;
};

[[nodiscard]] bool grantsPermission(const EmployeeRecord& employee, std::string_view permission);

} // namespace badgegate::auth

#endif // INCLUDE_BADGEGATE_AUTH_EMPLOYEE_HPP
