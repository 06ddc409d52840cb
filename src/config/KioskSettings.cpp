#include "badgegate/config/KioskSettings.hpp"

#include <QSettings>
#include <QString>
#include <QStringList>
#include <algorithm>
#include <array>
#include <limits>
#include <string_view>
#include <system_error>

namespace badgegate::config
{
namespace
{

constexpr std::array<std::string_view, 18> g_kKnownKeys{
    "reader/vendor_id",
    "reader/product_id",
    "reader/known_names",
    "reader/read_timeout_ms",
    "reader/max_read_errors",
    "reader/error_backoff_ms",
    "reader/join_timeout_ms",
    "reader/queue_capacity",
    "reader/duplicate_window_ms",
    "reader/min_token_length",
    "reader/max_buffer_bytes",
    "auth/max_attempts",
    "auth/lockout_minutes",
    "auth/session_timeout_minutes",
    "directory/database",
    "directory/seed_demo",
    "log/level",
    "log/file",
};

[[nodiscard]] QString keyOf(std::string_view key)
{
    return QString::fromUtf8(key.data(), static_cast<qsizetype>(key.size()));
}

template <class T> [[nodiscard]] T readUnsigned(const QSettings& settings, std::string_view key, T fallback)
{
    const QString qKey{ keyOf(key) };
    if (!settings.contains(qKey))
    {
        return fallback;
    }

    bool ok{ false };
    // Base 0 accepts both decimal and 0x-prefixed hex.
    const qulonglong value{ settings.value(qKey).toString().trimmed().toULongLong(&ok, 0) };
    if (!ok || value > static_cast<qulonglong>(std::numeric_limits<T>::max()))
    {
        throw ConfigError("config: invalid value for " + std::string{ key });
    }
    return static_cast<T>(value);
}

template <class Duration>
[[nodiscard]] Duration readDuration(const QSettings& settings, std::string_view key, Duration fallback)
{
    const auto count{ readUnsigned<std::uint32_t>(settings, key, static_cast<std::uint32_t>(fallback.count())) };
    return Duration{ count };
}

[[nodiscard]] bool readBool(const QSettings& settings, std::string_view key, bool fallback)
{
    const QString qKey{ keyOf(key) };
    if (!settings.contains(qKey))
    {
        return fallback;
    }

    const QString value{ settings.value(qKey).toString().trimmed().toLower() };
    if (value == "1" || value == "true" || value == "yes" || value == "on")
    {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off")
    {
        return false;
    }
    throw ConfigError("config: invalid boolean for " + std::string{ key });
}

[[nodiscard]] std::vector<std::string> readList(const QSettings& settings, std::string_view key,
                                                std::vector<std::string> fallback)
{
    const QString qKey{ keyOf(key) };
    if (!settings.contains(qKey))
    {
        return fallback;
    }

    // The INI reader already splits unquoted comma separated values into a QStringList.
    std::vector<std::string> out{};
    for (const QString& item : settings.value(qKey).toStringList())
    {
        const QString trimmed{ item.trimmed() };
        if (!trimmed.isEmpty())
        {
            out.push_back(trimmed.toStdString());
        }
    }
    return out;
}

void warnUnknownKeys(const QSettings& settings, const badgegate::log::Logger& logger)
{
    for (const QString& key : settings.allKeys())
    {
        const std::string k{ key.toStdString() };
        if (std::find(g_kKnownKeys.begin(), g_kKnownKeys.end(), k) == g_kKnownKeys.end())
        {
            logger.warn("ignoring unknown setting '{}'", k);
        }
    }
}

} // namespace

KioskConfig loadKioskConfig(const std::filesystem::path& path, const badgegate::log::Logger& logger)
{
    KioskConfig config{ defaultKioskConfig() };

    std::error_code ec{};
    if (!std::filesystem::exists(path, ec) || ec)
    {
        logger.info("no settings file at {}, using defaults", path.string());
        return config;
    }

    QSettings settings{ QString::fromStdString(path.string()), QSettings::IniFormat };
    if (settings.status() != QSettings::NoError)
    {
        throw ConfigError("config: failed to parse " + path.string());
    }

    warnUnknownKeys(settings, logger);

    ReaderConfig& r{ config.reader };
    r.vendorId = readUnsigned<std::uint16_t>(settings, "reader/vendor_id", r.vendorId);
    r.productId = readUnsigned<std::uint16_t>(settings, "reader/product_id", r.productId);
    r.knownReaderNames = readList(settings, "reader/known_names", r.knownReaderNames);
    r.readTimeout = readDuration(settings, "reader/read_timeout_ms", r.readTimeout);
    r.maxConsecutiveReadErrors = readUnsigned<std::size_t>(settings, "reader/max_read_errors",
                                                           r.maxConsecutiveReadErrors);
    r.errorBackoff = readDuration(settings, "reader/error_backoff_ms", r.errorBackoff);
    r.joinTimeout = readDuration(settings, "reader/join_timeout_ms", r.joinTimeout);
    r.queueCapacity = readUnsigned<std::size_t>(settings, "reader/queue_capacity", r.queueCapacity);
    r.duplicateWindow = readDuration(settings, "reader/duplicate_window_ms", r.duplicateWindow);
    r.minTokenLength = readUnsigned<std::size_t>(settings, "reader/min_token_length", r.minTokenLength);
    r.maxBufferBytes = readUnsigned<std::size_t>(settings, "reader/max_buffer_bytes", r.maxBufferBytes);

    AuthPolicy& a{ config.auth };
    a.maxAttempts = readUnsigned<std::size_t>(settings, "auth/max_attempts", a.maxAttempts);
    a.lockoutWindow = readDuration(settings, "auth/lockout_minutes", a.lockoutWindow);
    a.sessionTimeout = readDuration(settings, "auth/session_timeout_minutes", a.sessionTimeout);

    if (settings.contains("directory/database"))
    {
        config.directory.databasePath =
            std::filesystem::path{ settings.value("directory/database").toString().trimmed().toStdString() };
    }
    config.directory.seedDemoEmployees = readBool(settings, "directory/seed_demo", config.directory.seedDemoEmployees);

    if (settings.contains("log/level"))
    {
        const std::string level{ settings.value("log/level").toString().trimmed().toStdString() };
        const auto parsed{ badgegate::log::levelFromString(level) };
        if (!parsed.has_value())
        {
            throw ConfigError("config: invalid log level '" + level + "'");
        }
        config.log.level = *parsed;
    }
    config.log.file = settings.value("log/file", QString::fromStdString(config.log.file)).toString().toStdString();

    validate(config);
    return config;
}

void saveKioskConfig(const std::filesystem::path& path, const KioskConfig& config)
{
    QSettings settings{ QString::fromStdString(path.string()), QSettings::IniFormat };

    const ReaderConfig& r{ config.reader };
    settings.setValue("reader/vendor_id", QStringLiteral("0x%1").arg(r.vendorId, 4, 16, QLatin1Char('0')));
    settings.setValue("reader/product_id", QStringLiteral("0x%1").arg(r.productId, 4, 16, QLatin1Char('0')));
    QStringList names{};
    for (const auto& name : r.knownReaderNames)
    {
        names.push_back(QString::fromStdString(name));
    }
    settings.setValue("reader/known_names", names);
    settings.setValue("reader/read_timeout_ms", static_cast<qlonglong>(r.readTimeout.count()));
    settings.setValue("reader/max_read_errors", static_cast<qulonglong>(r.maxConsecutiveReadErrors));
    settings.setValue("reader/error_backoff_ms", static_cast<qlonglong>(r.errorBackoff.count()));
    settings.setValue("reader/join_timeout_ms", static_cast<qlonglong>(r.joinTimeout.count()));
    settings.setValue("reader/queue_capacity", static_cast<qulonglong>(r.queueCapacity));
    settings.setValue("reader/duplicate_window_ms", static_cast<qlonglong>(r.duplicateWindow.count()));
    settings.setValue("reader/min_token_length", static_cast<qulonglong>(r.minTokenLength));
    settings.setValue("reader/max_buffer_bytes", static_cast<qulonglong>(r.maxBufferBytes));

    settings.setValue("auth/max_attempts", static_cast<qulonglong>(config.auth.maxAttempts));
    settings.setValue("auth/lockout_minutes", static_cast<qlonglong>(config.auth.lockoutWindow.count()));
    settings.setValue("auth/session_timeout_minutes", static_cast<qlonglong>(config.auth.sessionTimeout.count()));

    settings.setValue("directory/database", QString::fromStdString(config.directory.databasePath.string()));
    settings.setValue("directory/seed_demo", config.directory.seedDemoEmployees);

    const std::string_view level{ badgegate::log::levelName(config.log.level) };
    settings.setValue("log/level", keyOf(level).toLower());
    settings.setValue("log/file", QString::fromStdString(config.log.file));

    settings.sync();
    if (settings.status() != QSettings::NoError)
    {
        throw ConfigError("config: failed to write " + path.string());
    }
}

} // namespace badgegate::config
