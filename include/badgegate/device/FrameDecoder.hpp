#ifndef INCLUDE_BADGEGATE_DEVICE_FRAMEDECODER_HPP
#define INCLUDE_BADGEGATE_DEVICE_FRAMEDECODER_HPP

#include "badgegate/log/Logger.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace badgegate::device
{

constexpr std::size_t g_kDefaultMinTokenLength{ 6U };
constexpr std::size_t g_kDefaultMaxBufferBytes{ 256U };

// Turns the keystroke stream of a keyboard-emulating reader into card tokens.
// A token is a run of printable ASCII terminated by CR or LF; tokens may span several reports.
class FrameDecoder final
{
public:
    explicit FrameDecoder(std::size_t minTokenLength = g_kDefaultMinTokenLength,
                          std::size_t maxBufferBytes = g_kDefaultMaxBufferBytes,
                          const badgegate::log::Logger& logger = badgegate::log::nullLogger());

    // Never throws on malformed input; anomalous bytes are dropped.
    [[nodiscard]] std::vector<std::string> feed(std::span<const std::uint8_t> report);

    void reset() noexcept;

    [[nodiscard]] const std::string& pending() const noexcept;
    [[nodiscard]] std::size_t droppedBytes() const noexcept;

private:
    void emitSegment(std::vector<std::string>& out);

    std::size_t m_minTokenLength{};
    std::size_t m_maxBufferBytes{};
    std::string m_buffer;
    std::size_t m_droppedBytes{};
    badgegate::log::Logger m_log;
};

} // namespace badgegate::device

#endif // INCLUDE_BADGEGATE_DEVICE_FRAMEDECODER_HPP
