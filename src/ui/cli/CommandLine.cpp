#include "CommandLine.hpp"

#include <cctype>
#include <cstdint>
#include <utility>

namespace badgegate::ui::cli
{
namespace
{

enum class Quote : std::uint8_t
{
    None,
    Single,
    Double,
};

class ArgumentBuilder final
{
public:
    void append(char c)
    {
        m_current.push_back(c);
        m_started = true;
    }

    void start() noexcept
    {
        m_started = true;
    }

    [[nodiscard]] bool started() const noexcept
    {
        return m_started;
    }

    void finish()
    {
        if (m_started)
        {
            m_args.push_back(std::move(m_current));
        }
        m_current.clear();
        m_started = false;
    }

    [[nodiscard]] std::vector<std::string> take()
    {
        finish();
        return std::move(m_args);
    }

private:
    std::vector<std::string> m_args;
    std::string m_current;
    bool m_started{ false };
};

} // namespace

std::vector<std::string> splitCommandLine(std::string_view line)
{
    ArgumentBuilder args{};
    Quote quote{ Quote::None };

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        const char c{ line[i] };
        const bool hasNext{ i + 1U < line.size() };

        if (quote == Quote::Single)
        {
            if (c == '\'')
            {
                quote = Quote::None;
            }
            else
            {
                args.append(c);
            }
            continue;
        }

        if (quote == Quote::Double)
        {
            if (c == '"')
            {
                quote = Quote::None;
            }
            else if (c == '\\' && hasNext && (line[i + 1U] == '"' || line[i + 1U] == '\\'))
            {
                args.append(line[++i]);
            }
            else
            {
                args.append(c);
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c)) != 0)
        {
            args.finish();
        }
        else if (c == '#' && !args.started())
        {
            break;
        }
        else if (c == '\'')
        {
            quote = Quote::Single;
            args.start();
        }
        else if (c == '"')
        {
            quote = Quote::Double;
            args.start();
        }
        else if (c == '\\' && hasNext)
        {
            args.append(line[++i]);
        }
        else
        {
            args.append(c);
        }
    }

    return args.take();
}

} // namespace badgegate::ui::cli
