#ifndef INCLUDE_BADGEGATE_CORE_CLOCK_HPP
#define INCLUDE_BADGEGATE_CORE_CLOCK_HPP

#include <chrono>
#include <functional>

namespace badgegate::core
{

// All windows (duplicate suppression, lockout, idle timeout) are measured on the monotonic clock.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using NowProvider = std::function<TimePoint()>;

} // namespace badgegate::core

#endif // INCLUDE_BADGEGATE_CORE_CLOCK_HPP
