#ifndef INCLUDE_BADGEGATE_CONFIG_KIOSKCONFIG_HPP
#define INCLUDE_BADGEGATE_CONFIG_KIOSKCONFIG_HPP

#include "badgegate/log/Logger.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace badgegate::config
{

class ConfigError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct ReaderConfig final
{
    std::uint16_t vendorId{};
    std::uint16_t productId{};
    // Fallback match: substring of the device product string.
    std::vector<std::string> knownReaderNames;
    std::chrono::milliseconds readTimeout{};
    std::size_t maxConsecutiveReadErrors{};
    // Pause after a failed read before the next attempt.
    std::chrono::milliseconds errorBackoff{};
    std::chrono::milliseconds joinTimeout{};
    std::size_t queueCapacity{};
    std::chrono::milliseconds duplicateWindow{};
    std::size_t minTokenLength{};
    std::size_t maxBufferBytes{};
};

struct AuthPolicy final
{
    std::size_t maxAttempts{};
    std::chrono::minutes lockoutWindow{};
    // Zero disables idle expiration.
    std::chrono::minutes sessionTimeout{};
};

struct DirectoryConfig final
{
    std::filesystem::path databasePath;
    bool seedDemoEmployees{ false };
};

struct LogConfig final
{
    badgegate::log::LogLevel level{ badgegate::log::LogLevel::Info };
    // Empty means stderr.
    std::string file;
};

struct KioskConfig final
{
    ReaderConfig reader{};
    AuthPolicy auth{};
    DirectoryConfig directory{};
    LogConfig log{};
};

[[nodiscard]] ReaderConfig defaultReaderConfig();
[[nodiscard]] AuthPolicy defaultAuthPolicy() noexcept;
[[nodiscard]] KioskConfig defaultKioskConfig();

// Throws ConfigError when a value is out of range (zero capacity, zero attempts, ...).
void validate(const KioskConfig& config);

} // namespace badgegate::config

#endif // INCLUDE_BADGEGATE_CONFIG_KIOSKCONFIG_HPP
