#ifndef INCLUDE_BADGEGATE_AUTH_IEMPLOYEEDIRECTORY_HPP
#define INCLUDE_BADGEGATE_AUTH_IEMPLOYEEDIRECTORY_HPP

#include "badgegate/auth/Employee.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace badgegate::auth
{

// Thrown by directory implementations when the backing store cannot be reached or is corrupt.
class DirectoryError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class ClockEventKind : std::uint8_t
{
    In,
    Out,
};

[[nodiscard]] constexpr std::string_view clockEventName(ClockEventKind kind) noexcept
{
    return kind == ClockEventKind::In ? "in" : "out";
}

class IEmployeeDirectory
{
public:
    IEmployeeDirectory() = default;
    IEmployeeDirectory(const IEmployeeDirectory&) = delete;
    IEmployeeDirectory& operator=(const IEmployeeDirectory&) = delete;
    IEmployeeDirectory(IEmployeeDirectory&&) = delete;
    IEmployeeDirectory& operator=(IEmployeeDirectory&&) = delete;
    virtual ~IEmployeeDirectory() = default;

    // Returns inactive employees too; the caller decides what "inactive" means.
    [[nodiscard]] virtual std::optional<EmployeeRecord> lookupEmployee(std::string_view cardId) = 0;
    [[nodiscard]] virtual std::optional<EmployeeRecord> lookupByDisplayName(std::string_view displayName) = 0;

    virtual void recordLastLogin(std::int64_t employeeId) = 0;
    virtual void recordClockEvent(std::int64_t employeeId, ClockEventKind kind) = 0;
};

} // namespace badgegate::auth

#endif // INCLUDE_BADGEGATE_AUTH_IEMPLOYEEDIRECTORY_HPP
