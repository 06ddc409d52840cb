#include "badgegate/auth/Employee.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>

namespace badgegate::auth
{

namespace
{

constexpr std::array<std::string_view, 3> g_kBasePermissions{ "view_own_profile", "change_own_language",
                                                              "view_deliveries" };
constexpr std::array<std::string_view, 4> g_kWorkerPermissions{ "scan_packages", "register_packages",
                                                                "manual_entry", "view_package_list" };
constexpr std::array<std::string_view, 6> g_kSupervisorPermissions{
    "create_delivery", "finish_delivery", "cancel_delivery", "view_statistics", "edit_packages", "delete_packages"
};
constexpr std::array<std::string_view, 4> g_kManagerPermissions{ "manage_employees", "view_reports", "export_data",
                                                                 "system_settings" };

template <std::size_t N> void addAll(PermissionSet& out, const std::array<std::string_view, N>& permissions)
{
    for (const auto permission : permissions)
    {
        out.emplace(permission);
    }
}

[[nodiscard]] bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept
{
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

} // namespace

std::string_view roleName(Role role) noexcept
{
    switch (role)
    {
    case Role::Worker:
        return "worker";
    case Role::Supervisor:
        return "supervisor";
    case Role::Manager:
        return "manager";
    case Role::Admin:
        return "admin";
    }
    return "worker";
}

std::optional<Role> roleFromString(std::string_view name) noexcept
{
    for (const Role role : { Role::Worker, Role::Supervisor, Role::Manager, Role::Admin })
    {
        if (equalsIgnoreCase(name, roleName(role)))
        {
            return role;
        }
    }
    return std::nullopt;
}

PermissionSet defaultPermissionsFor(Role role)
{
    PermissionSet out{};
    switch (role)
    {
    case Role::Admin:
        out.emplace(g_kWildcardPermission);
        return out;
    case Role::Manager:
        addAll(out, g_kManagerPermissions);
        [[fallthrough]];
    case Role::Supervisor:
        addAll(out, g_kSupervisorPermissions);
        [[fallthrough]];
    case Role::Worker:
        addAll(out, g_kWorkerPermissions);
        addAll(out, g_kBasePermissions);
        break;
    }
    return out;
}

bool grantsPermission(const EmployeeRecord& employee, std::string_view permission)
{
    return employee.permissions.contains(g_kWildcardPermission) || employee.permissions.contains(permission);
}

} // namespace badgegate::auth
