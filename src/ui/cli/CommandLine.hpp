#ifndef BADGEGATE_UI_CLI_COMMANDLINE_HPP
#define BADGEGATE_UI_CLI_COMMANDLINE_HPP

#include <string>
#include <string_view>
#include <vector>

namespace badgegate::ui::cli
{

// Splits one shell line into arguments.
//   'single quotes'  taken literally
//   "double quotes"  \" and \\ are unescaped
//   \x               outside quotes: literal x
//   # ...            comment when it starts an argument
// An unterminated quote runs to the end of the line.
[[nodiscard]] std::vector<std::string> splitCommandLine(std::string_view line);

} // namespace badgegate::ui::cli

#endif // BADGEGATE_UI_CLI_COMMANDLINE_HPP
