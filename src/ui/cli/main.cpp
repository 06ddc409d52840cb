#include "KioskShell.hpp"

#include "badgegate/auth/AuthenticationService.hpp"
#include "badgegate/config/KioskConfig.hpp"
#include "badgegate/config/KioskSettings.hpp"
#include "badgegate/device/DeviceSession.hpp"
#include "badgegate/device/hidapi/HidapiBackendFactory.hpp"
#include "badgegate/directory/sqlite/SqliteEmployeeDirectoryFactory.hpp"
#include "badgegate/log/Logger.hpp"
#include <CLI/CLI.hpp>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace
{

[[nodiscard]] badgegate::log::Logger makeLogger(const badgegate::config::LogConfig& config)
{
    std::shared_ptr<badgegate::log::ILogSink> sink{};
    if (config.file.empty())
    {
        sink = std::make_shared<badgegate::log::StreamLogSink>(std::cerr);
    }
    else
    {
        sink = std::make_shared<badgegate::log::StreamLogSink>(config.file);
    }
    return badgegate::log::Logger{ std::move(sink), config.level };
}

} // namespace

int main(int argc, char** argv)
{
    CLI::App app{ "BadgeGate - RFID employee identification kiosk" };

    std::string configPath{ "badgegate.ini" };
    std::string logLevel;
    std::string writeConfigPath;
    bool monitor{ false };
    app.add_option("-c,--config", configPath, "INI settings file")->capture_default_str();
    app.add_option("--log-level", logLevel, "debug, info, warn, error or off (overrides the settings file)");
    app.add_option("--write-config", writeConfigPath, "Write the effective settings to a file and exit");
    app.add_flag("-m,--monitor", monitor, "Connect the reader and log in on every scan at startup");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e);
    }

    try
    {
        // Settings problems are reported before the configured sink exists.
        const badgegate::log::Logger bootstrap{ std::make_shared<badgegate::log::StreamLogSink>(std::cerr),
                                                badgegate::log::LogLevel::Warn };
        auto config = badgegate::config::loadKioskConfig(configPath, bootstrap.child("config"));
        if (!logLevel.empty())
        {
            const auto level = badgegate::log::levelFromString(logLevel);
            if (!level.has_value())
            {
                std::cerr << "fatal: unknown log level '" << logLevel << "'\n";
                return 1;
            }
            config.log.level = *level;
        }

        if (!writeConfigPath.empty())
        {
            badgegate::config::saveKioskConfig(writeConfigPath, config);
            std::cout << "settings written to " << writeConfigPath << "\n";
            return 0;
        }

        const auto logger = makeLogger(config.log);
        logger.info("starting with settings from {}", configPath);

        auto backend = badgegate::device::hidapi::makeHidapiBackend();
        auto directory = badgegate::directory::sqlite::makeSqliteEmployeeDirectory(config.directory.databasePath,
                                                                                 config.directory.seedDemoEmployees);

        badgegate::device::DeviceSession device{ *backend, config.reader, logger };
        badgegate::auth::AuthenticationService auth{ *directory, config.auth, logger };
        badgegate::ui::cli::KioskShell shell{ device, auth, std::cin, std::cout };

        if (monitor)
        {
            shell.processLine("connect");
            shell.processLine("monitor on");
        }

        const int rc = shell.run();
        auth.logout();
        device.disconnect();
        logger.info("shutdown");
        return rc;
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
