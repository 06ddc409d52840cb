#include "badgegate/device/FrameDecoder.hpp"

#include <algorithm>
#include <string_view>

namespace badgegate::device
{
namespace
{

constexpr std::uint8_t g_kFirstPrintable{ 32U };
constexpr std::uint8_t g_kLastPrintable{ 126U };
constexpr std::uint8_t g_kCarriageReturn{ '\r' };
constexpr std::uint8_t g_kLineFeed{ '\n' };

[[nodiscard]] bool isPrintable(std::uint8_t b) noexcept
{
    return b >= g_kFirstPrintable && b <= g_kLastPrintable;
}

[[nodiscard]] bool isTerminator(std::uint8_t b) noexcept
{
    return b == g_kCarriageReturn || b == g_kLineFeed;
}

[[nodiscard]] std::string_view trimSpaces(std::string_view s) noexcept
{
    const auto first{ s.find_first_not_of(' ') };
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last{ s.find_last_not_of(' ') };
    return s.substr(first, last - first + 1U);
}

} // namespace

FrameDecoder::FrameDecoder(std::size_t minTokenLength, std::size_t maxBufferBytes, const badgegate::log::Logger& logger)
    : m_minTokenLength(minTokenLength), m_maxBufferBytes(std::max(maxBufferBytes, minTokenLength)),
      m_log(logger.child("decoder"))
{
    m_buffer.reserve(m_maxBufferBytes);
}

std::vector<std::string> FrameDecoder::feed(std::span<const std::uint8_t> report)
{
    std::vector<std::string> out{};

    // Idle poll.
    if (std::all_of(report.begin(), report.end(), [](std::uint8_t b) { return b == 0U; }))
    {
        return out;
    }

    for (const std::uint8_t b : report)
    {
        if (isTerminator(b))
        {
            emitSegment(out);
            continue;
        }

        if (isPrintable(b))
        {
            if (m_buffer.size() >= m_maxBufferBytes)
            {
                m_log.warn("discarding {} buffered bytes without terminator", m_buffer.size());
                m_droppedBytes += m_buffer.size();
                m_buffer.clear();
            }
            m_buffer.push_back(static_cast<char>(b));
            continue;
        }

        // Zero bytes pad fixed-size reports.
        if (b != 0U)
        {
            ++m_droppedBytes;
            m_log.debug("dropped non-printable byte 0x{:02x}", b);
        }
    }

    return out;
}

void FrameDecoder::emitSegment(std::vector<std::string>& out)
{
    const std::string_view token{ trimSpaces(m_buffer) };
    if (token.size() >= m_minTokenLength)
    {
        out.emplace_back(token);
    }
    else if (!token.empty())
    {
        m_log.debug("ignored short segment of {} chars", token.size());
    }
    m_buffer.clear();
}

void FrameDecoder::reset() noexcept
{
    m_buffer.clear();
    m_droppedBytes = 0U;
}

const std::string& FrameDecoder::pending() const noexcept
{
    return m_buffer;
}

std::size_t FrameDecoder::droppedBytes() const noexcept
{
    return m_droppedBytes;
}

} // namespace badgegate::device
