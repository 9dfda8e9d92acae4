#ifndef OSC_APP_APP_CONFIG_HPP
#define OSC_APP_APP_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace osc_app
{

/**
 * @brief Where the application keeps its data and how it logs
 */
struct AppConfig
{
  std::filesystem::path dataDirectory;
  std::filesystem::path metricDatabasePath;    // <data>/metrics.db
  std::filesystem::path settingsDatabasePath;  // <data>/settings.db
  std::filesystem::path logDirectory;          // <data>/logs
  spdlog::level::level_enum logLevel{spdlog::level::info};
  bool consoleLogging{true};

  /**
   * @brief Derive every path from a data directory
   */
  static AppConfig forDataDirectory(const std::filesystem::path& dataDirectory);
};

/// Environment variable naming the data directory
inline constexpr const char* kDataDirEnv = "OSC_DATA_DIR";
/// Environment variable naming the log level (trace, debug, info, ...)
inline constexpr const char* kLogLevelEnv = "OSC_LOG_LEVEL";

/**
 * @brief Resolve the application configuration
 *
 * Data directory: @p dataDirectory if given, else $OSC_DATA_DIR, else
 * "data" next to the executable. Log level: $OSC_LOG_LEVEL parsed by spdlog
 * (unknown names turn logging off, as spdlog does), default info.
 *
 * @throws std::runtime_error if the executable location is needed and cannot
 *         be determined
 */
AppConfig loadAppConfig(
  const std::optional<std::string>& dataDirectory = std::nullopt);

}  // namespace osc_app

#endif  // OSC_APP_APP_CONFIG_HPP
