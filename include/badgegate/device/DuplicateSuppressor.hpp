#ifndef INCLUDE_BADGEGATE_DEVICE_DUPLICATESUPPRESSOR_HPP
#define INCLUDE_BADGEGATE_DEVICE_DUPLICATESUPPRESSOR_HPP

#include "badgegate/core/Clock.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace badgegate::device
{

constexpr std::chrono::milliseconds g_kDefaultDuplicateWindow{ 2000 };

// A card held against the reader repeats its token; only the first one inside the window passes.
class DuplicateSuppressor final
{
public:
    explicit DuplicateSuppressor(std::chrono::milliseconds window = g_kDefaultDuplicateWindow) noexcept;

    [[nodiscard]] bool accept(std::string_view token, badgegate::core::TimePoint now);

    void reset() noexcept;

    [[nodiscard]] std::chrono::milliseconds window() const noexcept;

private:
    std::chrono::milliseconds m_window{};
    std::optional<std::string> m_lastToken;
    badgegate::core::TimePoint m_lastTime{};
};

} // namespace badgegate::device

#endif // INCLUDE_BADGEGATE_DEVICE_DUPLICATESUPPRESSOR_HPP
