// Ticket: 0001_first_start_bootstrap
// Test: SqliteSettingsStore persistence

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/null_sink.h>

#include "osc-store/src/SqliteSettingsStore.hpp"
#include "osc-utils/test/TestPaths.hpp"

namespace osc_store
{
namespace test
{

class SqliteSettingsStoreTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    testDbPath_ =
      osc_utils::test::uniqueTempPath("settings_store_test", ".db");
    removeDatabase();
  }

  void TearDown() override
  {
    removeDatabase();
  }

  void removeDatabase()
  {
    for (auto const* suffix : {"", "-wal", "-shm"})
    {
      std::filesystem::remove(testDbPath_.string() + suffix);
    }
  }

  osc_log::LogManager logs_{std::make_shared<spdlog::sinks::null_sink_mt>()};
  std::filesystem::path testDbPath_;
};

TEST_F(SqliteSettingsStoreTest, FreshDatabase_ReturnsDefaults)
{
  SqliteSettingsStore store{testDbPath_.string(), logs_};

  EXPECT_TRUE(store.isFirstAppStart());
  EXPECT_FALSE(store.isFileLoggingEnabled());
  EXPECT_TRUE(std::filesystem::exists(testDbPath_));
}

TEST_F(SqliteSettingsStoreTest, Constructor_DoesNotOpenDatabase)
{
  SqliteSettingsStore store{testDbPath_.string(), logs_};

  EXPECT_FALSE(std::filesystem::exists(testDbPath_));
}

TEST_F(SqliteSettingsStoreTest, Write_ThenRead)
{
  SqliteSettingsStore store{testDbPath_.string(), logs_};

  store.setFirstAppStart(false);
  store.setFileLoggingEnabled(true);

  EXPECT_FALSE(store.isFirstAppStart());
  EXPECT_TRUE(store.isFileLoggingEnabled());
}

TEST_F(SqliteSettingsStoreTest, Write_Overwrites)
{
  SqliteSettingsStore store{testDbPath_.string(), logs_};

  store.setFileLoggingEnabled(true);
  store.setFileLoggingEnabled(false);
  store.setFirstAppStart(false);
  store.setFirstAppStart(true);

  EXPECT_FALSE(store.isFileLoggingEnabled());
  EXPECT_TRUE(store.isFirstAppStart());
}

TEST_F(SqliteSettingsStoreTest, Values_PersistAcrossInstances)
{
  {
    SqliteSettingsStore store{testDbPath_.string(), logs_};
    store.setFirstAppStart(false);
    store.setFileLoggingEnabled(true);
  }

  SqliteSettingsStore reopened{testDbPath_.string(), logs_};
  EXPECT_FALSE(reopened.isFirstAppStart());
  EXPECT_TRUE(reopened.isFileLoggingEnabled());
}

TEST_F(SqliteSettingsStoreTest, OpenReadWrite_MissingFile_Throws)
{
  SqliteSettingsStore store{
    testDbPath_.string(), logs_, DBOpenCondition::OpenReadWrite};

  EXPECT_THROW(store.isFirstAppStart(), std::runtime_error);
  EXPECT_THROW(store.setFirstAppStart(false), std::runtime_error);
}

TEST_F(SqliteSettingsStoreTest, InvalidPath_Throws)
{
  SqliteSettingsStore store{"/nonexistent/path/to/settings.db", logs_};

  EXPECT_THROW(store.isFileLoggingEnabled(), std::runtime_error);
}

}  // namespace test
}  // namespace osc_store
