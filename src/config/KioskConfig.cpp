#include "badgegate/config/KioskConfig.hpp"

namespace badgegate::config
{

ReaderConfig defaultReaderConfig()
{
    // TS-HRW380 desktop reader.
    constexpr std::uint16_t kVendorId{ 0x25DDU };
    constexpr std::uint16_t kProductId{ 0x3000U };
    constexpr std::chrono::milliseconds kReadTimeout{ 100 };
    constexpr std::size_t kMaxConsecutiveReadErrors{ 3U };
    constexpr std::chrono::milliseconds kErrorBackoff{ 100 };
    constexpr std::chrono::milliseconds kJoinTimeout{ 2000 };
    constexpr std::size_t kQueueCapacity{ 10U };
    constexpr std::chrono::milliseconds kDuplicateWindow{ 2000 };
    constexpr std::size_t kMinTokenLength{ 6U };
    constexpr std::size_t kMaxBufferBytes{ 256U };

    return ReaderConfig{
        .vendorId = kVendorId,
        .productId = kProductId,
        .knownReaderNames = { "TS-HRW" },
        .readTimeout = kReadTimeout,
        .maxConsecutiveReadErrors = kMaxConsecutiveReadErrors,
        .errorBackoff = kErrorBackoff,
        .joinTimeout = kJoinTimeout,
        .queueCapacity = kQueueCapacity,
        .duplicateWindow = kDuplicateWindow,
        .minTokenLength = kMinTokenLength,
        .maxBufferBytes = kMaxBufferBytes,
    };
}

AuthPolicy defaultAuthPolicy() noexcept
{
    constexpr std::size_t kMaxAttempts{ 5U };
    constexpr std::chrono::minutes kLockoutWindow{ 15 };
    constexpr std::chrono::minutes kSessionTimeout{ 60 };

    return AuthPolicy{
        .maxAttempts = kMaxAttempts,
        .lockoutWindow = kLockoutWindow,
        .sessionTimeout = kSessionTimeout,
    };
}

KioskConfig defaultKioskConfig()
{
    KioskConfig config{};
    config.reader = defaultReaderConfig();
    config.auth = defaultAuthPolicy();
    config.directory.databasePath = std::filesystem::path{ "data" } / "badgegate.db";
    return config;
}

void validate(const KioskConfig& config)
{
    if (config.reader.queueCapacity == 0U)
    {
        throw ConfigError("config: reader.queue_capacity must be positive");
    }
    if (config.reader.maxConsecutiveReadErrors == 0U)
    {
        throw ConfigError("config: reader.max_read_errors must be positive");
    }
    if (config.reader.readTimeout.count() <= 0)
    {
        throw ConfigError("config: reader.read_timeout_ms must be positive");
    }
    if (config.reader.minTokenLength == 0U || config.reader.maxBufferBytes < config.reader.minTokenLength)
    {
        throw ConfigError("config: reader.min_token_length must be positive and fit in reader.max_buffer_bytes");
    }
    if (config.reader.vendorId == 0U && config.reader.knownReaderNames.empty())
    {
        throw ConfigError("config: reader needs a vendor id or at least one known reader name");
    }
    if (config.auth.maxAttempts == 0U)
    {
        throw ConfigError("config: auth.max_attempts must be positive");
    }
    if (config.auth.lockoutWindow.count() < 0 || config.auth.sessionTimeout.count() < 0)
    {
        throw ConfigError("config: auth windows must not be negative");
    }
    if (config.directory.databasePath.empty())
    {
        throw ConfigError("config: directory.database must not be empty");
    }
}

} // namespace badgegate::config
