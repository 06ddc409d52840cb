#include "KioskShell.hpp"

#include "badgegate/auth/AuthenticationService.hpp"
#include "badgegate/device/DeviceSession.hpp"
#include "badgegate/directory/sqlite/SqliteEmployeeDirectoryFactory.hpp"

#include "FakeHid.hpp"
#include "ManualClock.hpp"
#include "TestUtils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

using ::testing::HasSubstr;
using ::testing::Not;

class KioskShellTest : public ::testing::Test
{
protected:
    KioskShellTest()
    {
        m_backend.addDevice(badgegate::test_utils::readerInfo());

        auto reader = badgegate::config::defaultReaderConfig();
        reader.readTimeout = std::chrono::milliseconds{ 10 };
        reader.errorBackoff = std::chrono::milliseconds{ 1 };
        reader.joinTimeout = std::chrono::milliseconds{ 500 };

        m_device = std::make_unique<badgegate::device::DeviceSession>(m_backend, reader);
        m_auth = std::make_unique<badgegate::auth::AuthenticationService>(
            *m_directory, badgegate::config::defaultAuthPolicy(), badgegate::log::nullLogger(), m_clock.provider());
        m_shell = std::make_unique<badgegate::ui::cli::KioskShell>(*m_device, *m_auth, m_in, m_out);
    }

    // Returns only what this line printed.
    [[nodiscard]] std::string exec(const std::string& line)
    {
        m_out.str("");
        m_shell->processLine(line);
        return m_out.str();
    }

    badgegate::test_utils::FakeHidBackend m_backend;                               // NOLINT
    badgegate::test_utils::ManualClock m_clock;                                    // NOLINT
    std::unique_ptr<badgegate::auth::IEmployeeDirectory> m_directory{
        badgegate::directory::sqlite::makeSqliteEmployeeDirectory(":memory:", true) }; // NOLINT
    std::unique_ptr<badgegate::device::DeviceSession> m_device;                    // NOLINT
    std::unique_ptr<badgegate::auth::AuthenticationService> m_auth;                // NOLINT
    std::istringstream m_in;                                                       // NOLINT
    std::ostringstream m_out;                                                      // NOLINT
    std::unique_ptr<badgegate::ui::cli::KioskShell> m_shell;                       // NOLINT
};

TEST_F(KioskShellTest, HelpListsCommands)
{
    const auto out = exec("help");
    EXPECT_THAT(out, HasSubstr("login"));
    EXPECT_THAT(out, HasSubstr("monitor"));
    EXPECT_THAT(out, HasSubstr("Lift the lockout of an identifier"));
}

TEST_F(KioskShellTest, UnknownCommandIsSyntaxError)
{
    EXPECT_THAT(exec("frobnicate"), HasSubstr("Syntax Error:"));
    EXPECT_THAT(exec("login"), HasSubstr("Syntax Error:"));
    EXPECT_TRUE(m_shell->running());
}

TEST_F(KioskShellTest, LoginWhoamiLogout)
{
    EXPECT_EQ(exec("login 0987654321"), "Welcome, Anna Schmidt (worker).\n");
    EXPECT_EQ(exec("whoami"), "Anna Schmidt (worker, language de)\n");
    EXPECT_EQ(exec("can scan_packages"), "yes\n");
    EXPECT_EQ(exec("can export_data"), "no\n");
    EXPECT_THAT(exec("perms"), HasSubstr(" - scan_packages\n"));
    EXPECT_EQ(exec("touch"), "Activity refreshed.\n");
    EXPECT_EQ(exec("logout"), "Logged out.\n");
    EXPECT_EQ(exec("whoami"), "Not logged in.\n");
    EXPECT_EQ(exec("logout"), "Not logged in.\n");
    EXPECT_EQ(exec("perms"), "Error: Not logged in.\n");
}

TEST_F(KioskShellTest, ManualLoginJoinsNameWords)
{
    EXPECT_EQ(exec("manual Max Mustermann"), "Welcome, Max Mustermann (supervisor).\n");
    EXPECT_EQ(exec("manual 'Test User'"), "Welcome, Test User (worker).\n");
}

TEST_F(KioskShellTest, LockoutReportsRemainingMinutes)
{
    for (int i{}; i < 5; ++i)
    {
        EXPECT_EQ(exec("login 5555555555"), "Error: Unknown or inactive identifier.\n");
    }
    EXPECT_EQ(exec("login 5555555555"), "Error: Locked. Try again in 15 min.\n");

    m_clock.advance(std::chrono::minutes{ 6 });
    EXPECT_EQ(exec("login 5555555555"), "Error: Locked. Try again in 9 min.\n");
}

TEST_F(KioskShellTest, UnlockNeedsAdministrator)
{
    for (int i{}; i < 5; ++i)
    {
        (void)exec("login 5555555555");
    }

    EXPECT_EQ(exec("unlock 5555555555"), "Error: Permission denied.\n");
    ASSERT_EQ(exec("login 9999999999"), "Welcome, Kiosk Admin (admin).\n");
    EXPECT_EQ(exec("unlock 5555555555"), "Unlocked.\n");
    EXPECT_EQ(exec("unlock 5555555555"), "Not locked.\n");
    EXPECT_EQ(exec("login 5555555555"), "Error: Unknown or inactive identifier.\n");
}

TEST_F(KioskShellTest, StatsShowSessionAndLocks)
{
    for (int i{}; i < 5; ++i)
    {
        (void)exec("login 5555555555");
    }
    (void)exec("login 0987654321");
    m_clock.advance(std::chrono::minutes{ 3 });

    const auto out = exec("stats");

    EXPECT_THAT(out, HasSubstr("current user:    Anna Schmidt\n"));
    EXPECT_THAT(out, HasSubstr("authenticated:   yes\n"));
    EXPECT_THAT(out, HasSubstr("session minutes: 3\n"));
    EXPECT_THAT(out, HasSubstr("failed attempts: 5\n"));
    EXPECT_THAT(out, HasSubstr(" - ******5555\n"));
    EXPECT_THAT(out, Not(HasSubstr("5555555555")));
}

TEST_F(KioskShellTest, ReaderStatusAndDevices)
{
    EXPECT_THAT(exec("status"), HasSubstr("state:      disconnected\n"));
    EXPECT_EQ(exec("devices"), " - 25DD:3000 TS-HRW380 RFID Reader [/dev/hidraw-fake]\n");
    EXPECT_EQ(exec("scan 1"), "Error: Reader not connected.\n");

    EXPECT_EQ(exec("connect"), "Reader connected: 25DD:3000 TS-HRW380 RFID Reader\n");
    EXPECT_THAT(exec("status"), HasSubstr("state:      connected\n"));

    EXPECT_EQ(exec("disconnect"), "Reader disconnected.\n");
    EXPECT_THAT(exec("status"), HasSubstr("device:     -\n"));
}

TEST_F(KioskShellTest, ConnectWithoutReaderReportsError)
{
    badgegate::test_utils::FakeHidBackend empty{};
    badgegate::device::DeviceSession device{ empty, badgegate::config::defaultReaderConfig() };
    std::ostringstream out;
    badgegate::ui::cli::KioskShell shell{ device, *m_auth, m_in, out };

    shell.processLine("connect");

    EXPECT_EQ(out.str(), "Error: " + std::string{ badgegate::device::describe(
                                         badgegate::device::DeviceError::DeviceUnavailable) } +
                             ".\n");
}

TEST_F(KioskShellTest, ScanLogsInWithPresentedCard)
{
    ASSERT_THAT(exec("connect"), HasSubstr("Reader connected"));
    m_backend.script().pushText("0987654321\r");

    const auto out = exec("scan 2");

    EXPECT_THAT(out, HasSubstr("Present card (2 s)...\n"));
    EXPECT_THAT(out, HasSubstr("Welcome, Anna Schmidt (worker).\n"));
}

TEST_F(KioskShellTest, ScanRejectsOutOfRangeTimeout)
{
    EXPECT_THAT(exec("scan 0"), HasSubstr("Syntax Error:"));
    EXPECT_THAT(exec("scan 301"), HasSubstr("Syntax Error:"));
}

TEST_F(KioskShellTest, MonitorLogsInOnEveryScan)
{
    EXPECT_EQ(exec("monitor on"), "Error: Reader not connected.\n");
    ASSERT_THAT(exec("connect"), HasSubstr("Reader connected"));
    EXPECT_EQ(exec("monitor on"), "Monitoring on.\n");
    EXPECT_EQ(exec("monitor on"), "Error: Monitoring already on.\n");

    m_backend.script().pushText("1234567890\r");
    ASSERT_TRUE(badgegate::test_utils::waitUntil([this] { return m_auth->isAuthenticated(); }));
    EXPECT_EQ(m_auth->getCurrentUser()->displayName, "Max Mustermann");

    EXPECT_EQ(exec("monitor off"), "Monitoring off.\n");
    EXPECT_THAT(exec("monitor sometimes"), HasSubstr("Syntax Error:"));
}

TEST_F(KioskShellTest, RunLoopsUntilExit)
{
    m_in.str("login 0987654321\n\nwhoami\nexit\nwhoami\n");

    EXPECT_EQ(m_shell->run(), 0);

    const auto out = m_out.str();
    EXPECT_THAT(out, HasSubstr("badgegate> "));
    EXPECT_THAT(out, HasSubstr("badgegate(Anna Schmidt)> "));
    EXPECT_THAT(out, HasSubstr("Anna Schmidt (worker, language de)\n"));
    EXPECT_FALSE(m_shell->running());
}

TEST_F(KioskShellTest, RunStopsAtEndOfInput)
{
    m_in.str("whoami\n");

    EXPECT_EQ(m_shell->run(), 0);
    EXPECT_THAT(m_out.str(), HasSubstr("Not logged in.\n"));
    EXPECT_TRUE(m_shell->running());
}
