#ifndef INCLUDE_BADGEGATE_LOG_LOGGER_HPP
#define INCLUDE_BADGEGATE_LOG_LOGGER_HPP

#include <cstdint>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace badgegate::log
{

enum class LogLevel : std::uint8_t
{
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

[[nodiscard]] std::string_view levelName(LogLevel level) noexcept;
[[nodiscard]] std::optional<LogLevel> levelFromString(std::string_view name) noexcept;

class ILogSink
{
public:
    ILogSink() = default;
    ILogSink(const ILogSink&) = delete;
    ILogSink& operator=(const ILogSink&) = delete;
    ILogSink(ILogSink&&) = delete;
    ILogSink& operator=(ILogSink&&) = delete;
    virtual ~ILogSink() = default;

    virtual void write(LogLevel level, std::string_view component, std::string_view message) = 0;
};

// Appends "YYYY-MM-DD HH:MM:SS | LEVEL | component | message" lines.
class StreamLogSink final : public ILogSink
{
public:
    explicit StreamLogSink(std::ostream& out) noexcept;

    // Opens `path` in append mode; throws std::runtime_error when the file cannot be opened.
    explicit StreamLogSink(const std::string& path);

    void write(LogLevel level, std::string_view component, std::string_view message) override;

private:
    std::ofstream m_file;
    std::ostream* m_out{ nullptr };
    std::mutex m_mutex;
};

struct LogRecord final
{
    LogLevel level{ LogLevel::Info };
    std::string component;
    std::string message;
};

// Keeps every record in memory. Used by tests to assert on emitted diagnostics.
class MemoryLogSink final : public ILogSink
{
public:
    void write(LogLevel level, std::string_view component, std::string_view message) override;

    [[nodiscard]] std::vector<LogRecord> records() const;
    [[nodiscard]] bool contains(LogLevel level, std::string_view needle) const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::vector<LogRecord> m_records;
};

class Logger final
{
public:
    Logger() noexcept = default;
    Logger(std::shared_ptr<ILogSink> sink, LogLevel threshold) noexcept;

    void setThreshold(LogLevel threshold) noexcept;
    [[nodiscard]] LogLevel threshold() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    // Returns a logger that shares the sink and threshold but tags records with `component`.
    [[nodiscard]] Logger child(std::string_view component) const;

    template <class... Args> void debug(fmt::format_string<Args...> format, Args&&... args) const
    {
        emit(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template <class... Args> void info(fmt::format_string<Args...> format, Args&&... args) const
    {
        emit(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template <class... Args> void warn(fmt::format_string<Args...> format, Args&&... args) const
    {
        emit(LogLevel::Warn, format, std::forward<Args>(args)...);
    }

    template <class... Args> void error(fmt::format_string<Args...> format, Args&&... args) const
    {
        emit(LogLevel::Error, format, std::forward<Args>(args)...);
    }

private:
    template <class... Args> void emit(LogLevel level, fmt::format_string<Args...> format, Args&&... args) const
    {
        if (!enabled(level))
        {
            return;
        }
        m_sink->write(level, m_component, fmt::format(format, std::forward<Args>(args)...));
    }

    std::shared_ptr<ILogSink> m_sink;
    std::string m_component{ "badgegate" };
    LogLevel m_threshold{ LogLevel::Off };
};

// Shared logger that discards everything; default for components constructed without one.
[[nodiscard]] Logger& nullLogger() noexcept;

// Card identifiers are credentials: only the last four characters are shown.
[[nodiscard]] std::string maskCardId(std::string_view cardId);

} // namespace badgegate::log

#endif // INCLUDE_BADGEGATE_LOG_LOGGER_HPP
