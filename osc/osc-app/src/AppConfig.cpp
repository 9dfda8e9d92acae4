#include "osc-app/src/AppConfig.hpp"

#include <cstdlib>

#include "osc-utils/src/PathUtils.hpp"

namespace osc_app
{

AppConfig AppConfig::forDataDirectory(
  const std::filesystem::path& dataDirectory)
{
  AppConfig config;
  config.dataDirectory = dataDirectory;
  config.metricDatabasePath = dataDirectory / "metrics.db";
  config.settingsDatabasePath = dataDirectory / "settings.db";
  config.logDirectory = dataDirectory / "logs";
  return config;
}

AppConfig loadAppConfig(const std::optional<std::string>& dataDirectory)
{
  std::filesystem::path dir;
  if (dataDirectory.has_value() && !dataDirectory->empty())
  {
    dir = *dataDirectory;
  }
  else if (const char* env = std::getenv(kDataDirEnv); env && *env)
  {
    dir = env;
  }
  else
  {
    dir = osc_utils::absolutePath("data");
  }

  auto config = AppConfig::forDataDirectory(dir);

  if (const char* level = std::getenv(kLogLevelEnv); level && *level)
  {
    config.logLevel = spdlog::level::from_str(level);
  }

  return config;
}

}  // namespace osc_app
