// Ticket: 0001_first_start_bootstrap
// Test: AppConfig resolution

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <string>

#include "osc-app/src/AppConfig.hpp"
#include "osc-utils/src/PathUtils.hpp"

namespace osc_app
{
namespace test
{

class AppConfigTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    unsetenv(kDataDirEnv);
    unsetenv(kLogLevelEnv);
  }

  void TearDown() override
  {
    unsetenv(kDataDirEnv);
    unsetenv(kLogLevelEnv);
  }
};

TEST_F(AppConfigTest, ForDataDirectory_DerivesPaths)
{
  auto const config = AppConfig::forDataDirectory("/var/lib/osc");

  EXPECT_EQ(config.dataDirectory, std::filesystem::path{"/var/lib/osc"});
  EXPECT_EQ(config.metricDatabasePath,
            std::filesystem::path{"/var/lib/osc/metrics.db"});
  EXPECT_EQ(config.settingsDatabasePath,
            std::filesystem::path{"/var/lib/osc/settings.db"});
  EXPECT_EQ(config.logDirectory, std::filesystem::path{"/var/lib/osc/logs"});
  EXPECT_EQ(config.logLevel, spdlog::level::info);
  EXPECT_TRUE(config.consoleLogging);
}

TEST_F(AppConfigTest, Load_Default_UsesDataNextToExecutable)
{
  auto const config = loadAppConfig();

  EXPECT_EQ(config.dataDirectory, osc_utils::absolutePath("data"));
}

TEST_F(AppConfigTest, Load_EnvironmentOverridesDefault)
{
  setenv(kDataDirEnv, "/tmp/osc-env", 1);

  EXPECT_EQ(loadAppConfig().dataDirectory,
            std::filesystem::path{"/tmp/osc-env"});
}

TEST_F(AppConfigTest, Load_ArgumentOverridesEnvironment)
{
  setenv(kDataDirEnv, "/tmp/osc-env", 1);

  EXPECT_EQ(loadAppConfig("/tmp/osc-arg").dataDirectory,
            std::filesystem::path{"/tmp/osc-arg"});
}

TEST_F(AppConfigTest, Load_EmptyArgumentIgnored)
{
  setenv(kDataDirEnv, "/tmp/osc-env", 1);

  EXPECT_EQ(loadAppConfig(std::string{}).dataDirectory,
            std::filesystem::path{"/tmp/osc-env"});
}

TEST_F(AppConfigTest, Load_LogLevelFromEnvironment)
{
  setenv(kLogLevelEnv, "debug", 1);

  EXPECT_EQ(loadAppConfig("/tmp/osc-arg").logLevel, spdlog::level::debug);
}

}  // namespace test
}  // namespace osc_app
