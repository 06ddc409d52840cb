#ifndef INCLUDE_BADGEGATE_CONFIG_KIOSKSETTINGS_HPP
#define INCLUDE_BADGEGATE_CONFIG_KIOSKSETTINGS_HPP

#include "badgegate/config/KioskConfig.hpp"
#include "badgegate/log/Logger.hpp"
#include <filesystem>

namespace badgegate::config
{

// Loads an INI file ([reader], [auth], [directory], [log] groups) on top of defaultKioskConfig().
// A missing file yields the defaults; a malformed value throws ConfigError; unknown keys are logged and ignored.
[[nodiscard]] KioskConfig loadKioskConfig(const std::filesystem::path& path,
                                          const badgegate::log::Logger& logger = badgegate::log::nullLogger());

// Writes every setting back so operators get a complete template to edit.
void saveKioskConfig(const std::filesystem::path& path, const KioskConfig& config);

} // namespace badgegate::config

#endif // INCLUDE_BADGEGATE_CONFIG_KIOSKSETTINGS_HPP
