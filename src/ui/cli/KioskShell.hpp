#ifndef BADGEGATE_UI_CLI_KIOSKSHELL_HPP
#define BADGEGATE_UI_CLI_KIOSKSHELL_HPP

#include "badgegate/auth/AuthenticationService.hpp"
#include "badgegate/device/DeviceSession.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace badgegate::ui::cli
{

// Operator console of the kiosk. Each input line is parsed by a fresh CLI11 app.
// Scans picked up by the monitor thread are reported on the same output stream.
class KioskShell final
{
public:
    KioskShell(badgegate::device::DeviceSession& device, badgegate::auth::AuthenticationService& auth,
               std::istream& in, std::ostream& out);

    KioskShell(const KioskShell&) = delete;
    KioskShell& operator=(const KioskShell&) = delete;
    KioskShell(KioskShell&&) = delete;
    KioskShell& operator=(KioskShell&&) = delete;
    ~KioskShell();

    int run();

    // Executes one command line; exposed for scripted use.
    void processLine(const std::string& line);

    [[nodiscard]] bool running() const noexcept;

private:
    badgegate::device::DeviceSession& m_device;
    badgegate::auth::AuthenticationService& m_auth;
    std::istream& m_in;
    std::ostream& m_out;
    std::mutex m_outMutex;
    bool m_running{ true };

    void say(std::string_view text);
    void reportAuthResult(const badgegate::auth::AuthResult& result, std::string_view identifier);
    [[nodiscard]] std::string prompt();

    void doLogin(const std::string& cardId);
    void doManual(const std::vector<std::string>& nameParts);
    void doWhoami();
    void doCan(const std::string& permission);
    void doPerms();
    void doTouch();
    void doLogout();
    void doUnlock(const std::string& identifier);
    void doStats();
    void doConnect();
    void doDisconnect();
    void doStatus();
    void doDevices();
    void doScan(std::chrono::seconds timeout);
    void doMonitor(const std::string& mode);
};

} // namespace badgegate::ui::cli

#endif // BADGEGATE_UI_CLI_KIOSKSHELL_HPP
