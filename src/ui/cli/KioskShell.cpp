#include "KioskShell.hpp"
#include "CommandLine.hpp"

#include "badgegate/log/Logger.hpp"
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <variant>

namespace badgegate::ui::cli
{
namespace
{

constexpr int g_kDefaultScanSeconds{ 10 };
constexpr int g_kMaxScanSeconds{ 300 };

[[nodiscard]] std::string yesNo(bool value)
{
    return value ? "yes" : "no";
}

[[nodiscard]] std::string joinWords(const std::vector<std::string>& words)
{
    std::string out{};
    for (const auto& word : words)
    {
        if (!out.empty())
        {
            out.push_back(' ');
        }
        out.append(word);
    }
    return out;
}

} // namespace

KioskShell::KioskShell(badgegate::device::DeviceSession& device, badgegate::auth::AuthenticationService& auth,
                       std::istream& in, std::ostream& out)
    : m_device(device), m_auth(auth), m_in(in), m_out(out)
{
}

KioskShell::~KioskShell()
{
    // The monitor callbacks capture this shell.
    m_device.stopMonitoring();
}

int KioskShell::run()
{
    say("BadgeGate kiosk shell\nType 'help' for available commands.\n");

    std::string line;
    while (m_running && m_in.good())
    {
        say(prompt());

        if (!std::getline(m_in, line))
        {
            break; // EOF
        }

        if (line.empty())
        {
            continue;
        }

        processLine(line);
    }
    return 0;
}

bool KioskShell::running() const noexcept
{
    return m_running;
}

std::string KioskShell::prompt()
{
    const auto user = m_auth.getCurrentUser();
    if (user.has_value())
    {
        return fmt::format("badgegate({})> ", user->displayName);
    }
    return "badgegate> ";
}

void KioskShell::processLine(const std::string& line)
{
    std::vector<std::string> userArgs = splitCommandLine(line);

    if (userArgs.empty())
    {
        return;
    }

    // 'help' prints the root help, not the help of the 'help' subcommand.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("badgegate");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "BadgeGate kiosk shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Exit the shell")->alias("quit")->callback([this]() { m_running = false; });

    // Authentication
    std::string identifierArg;
    auto* subLogin = app.add_subcommand("login", "Log in with a card id");
    subLogin->add_option("card", identifierArg, "Card identifier")->required();
    subLogin->callback([&]() { doLogin(identifierArg); });

    std::vector<std::string> nameArgs;
    auto* subManual = app.add_subcommand("manual", "Log in by employee name (manual fallback)");
    subManual->add_option("name", nameArgs, "Display name")->required();
    subManual->callback([&]() { doManual(nameArgs); });

    app.add_subcommand("whoami", "Show the logged-in employee")->callback([this]() { doWhoami(); });

    std::string permissionArg;
    auto* subCan = app.add_subcommand("can", "Check a permission of the current user");
    subCan->add_option("permission", permissionArg, "Permission name")->required();
    subCan->callback([&]() { doCan(permissionArg); });

    app.add_subcommand("perms", "List permissions of the current user")->callback([this]() { doPerms(); });
    app.add_subcommand("touch", "Refresh the session idle timer")->callback([this]() { doTouch(); });
    app.add_subcommand("logout", "End the current session")->callback([this]() { doLogout(); });

    auto* subUnlock = app.add_subcommand("unlock", "Lift the lockout of an identifier");
    subUnlock->add_option("identifier", identifierArg, "Card id or display name")->required();
    subUnlock->callback([&]() { doUnlock(identifierArg); });

    app.add_subcommand("stats", "Show login statistics")->callback([this]() { doStats(); });

    // Reader
    app.add_subcommand("connect", "Connect to the card reader")->callback([this]() { doConnect(); });
    app.add_subcommand("disconnect", "Disconnect the card reader")->callback([this]() { doDisconnect(); });
    app.add_subcommand("status", "Show reader status")->callback([this]() { doStatus(); });
    app.add_subcommand("devices", "List visible HID devices")->callback([this]() { doDevices(); });

    int scanSeconds{ g_kDefaultScanSeconds };
    auto* subScan = app.add_subcommand("scan", "Wait for one card and log in with it");
    subScan->add_option("seconds", scanSeconds, "How long to wait")->check(CLI::Range(1, g_kMaxScanSeconds));
    subScan->callback([&]() { doScan(std::chrono::seconds{ scanSeconds }); });

    std::string modeArg;
    auto* subMonitor = app.add_subcommand("monitor", "Log in automatically on every scan");
    subMonitor->add_option("mode", modeArg, "on or off")->required()->check(CLI::IsMember({ "on", "off" }));
    subMonitor->callback([&]() { doMonitor(modeArg); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        say(app.help());
    }
    catch (const CLI::ParseError& e)
    {
        say(fmt::format("Syntax Error: {}\n", e.what()));
    }
}

void KioskShell::say(std::string_view text)
{
    std::lock_guard<std::mutex> lock{ m_outMutex };
    m_out << text;
    m_out.flush();
}

void KioskShell::reportAuthResult(const badgegate::auth::AuthResult& result, std::string_view identifier)
{
    if (const auto* employee = std::get_if<badgegate::auth::EmployeeRecord>(&result))
    {
        say(fmt::format("Welcome, {} ({}).\n", employee->displayName, badgegate::auth::roleName(employee->role)));
        return;
    }

    const auto error = std::get<badgegate::auth::AuthError>(result);
    switch (error)
    {
    case badgegate::auth::AuthError::Locked:
        say(fmt::format("Error: Locked. Try again in {} min.\n", m_auth.remainingLockout(identifier).count()));
        break;
    case badgegate::auth::AuthError::Unauthorized:
        say("Error: Unknown or inactive identifier.\n");
        break;
    case badgegate::auth::AuthError::DirectoryUnavailable:
        say("Error: Employee directory unavailable.\n");
        break;
    }
}

// --- Handlers ---

void KioskShell::doLogin(const std::string& cardId)
{
    reportAuthResult(m_auth.authenticate(cardId), cardId);
}

void KioskShell::doManual(const std::vector<std::string>& nameParts)
{
    const std::string name{ joinWords(nameParts) };
    reportAuthResult(m_auth.authenticateManual(name), name);
}

void KioskShell::doWhoami()
{
    const auto user = m_auth.getCurrentUser();
    if (!user.has_value())
    {
        say("Not logged in.\n");
        return;
    }
    say(fmt::format("{} ({}, language {})\n", user->displayName, badgegate::auth::roleName(user->role),
                    user->language));
}

void KioskShell::doCan(const std::string& permission)
{
    say(yesNo(m_auth.hasPermission(permission)) + "\n");
}

void KioskShell::doPerms()
{
    if (!m_auth.isAuthenticated())
    {
        say("Error: Not logged in.\n");
        return;
    }

    const auto permissions = m_auth.currentPermissions();
    if (permissions.empty())
    {
        say("(none)\n");
        return;
    }
    std::string out{};
    for (const auto& permission : permissions)
    {
        out += fmt::format(" - {}\n", permission);
    }
    say(out);
}

void KioskShell::doTouch()
{
    if (!m_auth.isAuthenticated())
    {
        say("Error: Not logged in.\n");
        return;
    }
    m_auth.updateActivity();
    say("Activity refreshed.\n");
}

void KioskShell::doLogout()
{
    if (!m_auth.isAuthenticated())
    {
        say("Not logged in.\n");
        return;
    }
    m_auth.logout();
    say("Logged out.\n");
}

void KioskShell::doUnlock(const std::string& identifier)
{
    switch (m_auth.unlockAccount(identifier))
    {
    case badgegate::auth::UnlockResult::Unlocked:
        say("Unlocked.\n");
        break;
    case badgegate::auth::UnlockResult::NotLocked:
        say("Not locked.\n");
        break;
    case badgegate::auth::UnlockResult::PermissionDenied:
        say("Error: Permission denied.\n");
        break;
    }
}

void KioskShell::doStats()
{
    const auto stats = m_auth.loginStatistics();
    std::string out{};
    out += fmt::format("current user:    {}\n", stats.currentUser.value_or("-"));
    out += fmt::format("authenticated:   {}\n", yesNo(stats.authenticated));
    out += fmt::format("session minutes: {}\n",
                       std::chrono::duration_cast<std::chrono::minutes>(stats.sessionDuration).count());
    out += fmt::format("failed attempts: {}\n", stats.failedAttempts);
    out += fmt::format("locked:          {}\n", stats.lockedIdentifiers.size());
    for (const auto& identifier : stats.lockedIdentifiers)
    {
        out += fmt::format(" - {}\n", badgegate::log::maskCardId(identifier));
    }
    say(out);
}

void KioskShell::doConnect()
{
    const auto result = m_device.connect();
    if (const auto* error = std::get_if<badgegate::device::DeviceError>(&result))
    {
        say(fmt::format("Error: {}.\n", badgegate::device::describe(*error)));
        return;
    }
    say(fmt::format("Reader connected: {}\n", m_device.status().device));
}

void KioskShell::doDisconnect()
{
    m_device.disconnect();
    say("Reader disconnected.\n");
}

void KioskShell::doStatus()
{
    const auto status = m_device.status();
    std::string out{};
    out += fmt::format("state:      {}\n", badgegate::device::stateName(status.state));
    out += fmt::format("monitoring: {}\n", yesNo(status.monitoring));
    out += fmt::format("device:     {}\n", status.device.empty() ? "-" : status.device);
    out += fmt::format("last error: {}\n", status.lastError.value_or("-"));
    say(out);
}

void KioskShell::doDevices()
{
    const auto devices = m_device.listDevices();
    if (devices.empty())
    {
        say("(no HID devices)\n");
        return;
    }
    std::string out{};
    for (const auto& info : devices)
    {
        out += fmt::format(" - {} [{}]\n", badgegate::device::describeDevice(info), info.path);
    }
    say(out);
}

void KioskShell::doScan(std::chrono::seconds timeout)
{
    if (!m_device.status().connected)
    {
        say("Error: Reader not connected.\n");
        return;
    }
    if (m_device.status().monitoring)
    {
        say("Error: Monitoring is on; scans are handled automatically.\n");
        return;
    }

    say(fmt::format("Present card ({} s)...\n", timeout.count()));
    const auto cardId = m_device.readCard(timeout);
    if (!cardId.has_value())
    {
        say("No card read.\n");
        return;
    }
    reportAuthResult(m_auth.authenticate(*cardId), *cardId);
}

void KioskShell::doMonitor(const std::string& mode)
{
    if (mode == "off")
    {
        m_device.stopMonitoring();
        say("Monitoring off.\n");
        return;
    }

    const bool started = m_device.startMonitoring(
        [this](const std::string& cardId) {
            say("\n[scan] ");
            reportAuthResult(m_auth.authenticate(cardId), cardId);
        },
        [this](const badgegate::device::DeviceStatus& status) {
            if (status.state == badgegate::device::DeviceState::Error)
            {
                say(fmt::format("\n[reader] {}\n", status.lastError.value_or("error")));
            }
        });

    if (!started)
    {
        say(m_device.status().connected ? "Error: Monitoring already on.\n" : "Error: Reader not connected.\n");
        return;
    }
    say("Monitoring on.\n");
}

} // namespace badgegate::ui::cli
