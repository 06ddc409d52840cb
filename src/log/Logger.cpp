#include "badgegate/log/Logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>

namespace badgegate::log
{
namespace
{

constexpr std::size_t g_kVisibleCardChars{ 4U };

[[nodiscard]] std::tm localTimeNow() noexcept
{
    const auto now{ std::chrono::system_clock::now() };
    const std::time_t tt{ std::chrono::system_clock::to_time_t(now) };
    std::tm out{};
#if defined(_WIN32)
    localtime_s(&out, &tt);
#else
    localtime_r(&tt, &out);
#endif
    return out;
}

[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (std::size_t i{}; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
        {
            return false;
        }
    }
    return true;
}

} // namespace

std::string_view levelName(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> levelFromString(std::string_view name) noexcept
{
    constexpr std::array<LogLevel, 5> kLevels{ LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error,
                                               LogLevel::Off };
    for (const LogLevel level : kLevels)
    {
        if (equalsIgnoreCase(name, levelName(level)))
        {
            return level;
        }
    }
    if (equalsIgnoreCase(name, "warning"))
    {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

StreamLogSink::StreamLogSink(std::ostream& out) noexcept : m_out(&out)
{
}

StreamLogSink::StreamLogSink(const std::string& path) : m_file(path, std::ios::app)
{
    if (!m_file)
    {
        throw std::runtime_error("log: failed to open log file " + path);
    }
    m_out = &m_file;
}

void StreamLogSink::write(LogLevel level, std::string_view component, std::string_view message)
{
    const std::tm tm{ localTimeNow() };

    std::lock_guard<std::mutex> lock{ m_mutex };
    *m_out << std::put_time(&tm, "%F %T") << " | " << levelName(level) << " | " << component << " | " << message
           << '\n';
    m_out->flush();
}

void MemoryLogSink::write(LogLevel level, std::string_view component, std::string_view message)
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    m_records.push_back(LogRecord{ level, std::string{ component }, std::string{ message } });
}

std::vector<LogRecord> MemoryLogSink::records() const
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    return m_records;
}

bool MemoryLogSink::contains(LogLevel level, std::string_view needle) const
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    return std::any_of(m_records.begin(), m_records.end(), [&](const LogRecord& r)
                       { return r.level == level && r.message.find(needle) != std::string::npos; });
}

void MemoryLogSink::clear()
{
    std::lock_guard<std::mutex> lock{ m_mutex };
    m_records.clear();
}

Logger::Logger(std::shared_ptr<ILogSink> sink, LogLevel threshold) noexcept
    : m_sink(std::move(sink)), m_threshold(threshold)
{
}

void Logger::setThreshold(LogLevel threshold) noexcept
{
    m_threshold = threshold;
}

LogLevel Logger::threshold() const noexcept
{
    return m_threshold;
}

bool Logger::enabled(LogLevel level) const noexcept
{
    return m_sink != nullptr && level != LogLevel::Off && level >= m_threshold;
}

Logger Logger::child(std::string_view component) const
{
    Logger out{ m_sink, m_threshold };
    out.m_component = std::string{ component };
    return out;
}

Logger& nullLogger() noexcept
{
    static Logger s_logger{};
    return s_logger;
}

std::string maskCardId(std::string_view cardId)
{
    if (cardId.size() <= g_kVisibleCardChars)
    {
        return std::string(cardId.size(), '*');
    }
    std::string out(cardId.size() - g_kVisibleCardChars, '*');
    out.append(cardId.substr(cardId.size() - g_kVisibleCardChars));
    return out;
}

} // namespace badgegate::log
