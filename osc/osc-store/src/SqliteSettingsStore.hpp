// Ticket: 0001_first_start_bootstrap

#ifndef OSC_STORE_SQLITE_SETTINGS_STORE_HPP
#define OSC_STORE_SQLITE_SETTINGS_STORE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <sqlite3.h>

#include "osc-log/src/LogManager.hpp"
#include "osc-store/src/SettingsStore.hpp"

namespace osc_store
{

/*!
 * @brief Enum class for SQLite open conditions
 */
enum class DBOpenCondition : int
{
  OpenReadWrite = SQLITE_OPEN_READWRITE,
  OpenCreate = SQLITE_OPEN_CREATE | SQLITE_OPEN_READWRITE,
};

/**
 * @brief SettingsStore backed by a key/value table in a SQLite file
 *
 * Schema: settings(key TEXT PRIMARY KEY, value INTEGER NOT NULL). Writes are
 * upserts. The connection is opened on first access, so a missing or
 * unreadable file is reported by the first read or write rather than by the
 * constructor; a failed open is retried on the next access.
 *
 * Thread Safety:
 *   All public methods are thread-safe via internal mutex.
 */
class SqliteSettingsStore : public SettingsStore
{
public:
  static constexpr const char* kFirstAppStartKey = "is_first_app_start";
  static constexpr const char* kFileLoggingEnabledKey =
    "is_file_logging_enabled";

  /**
   * @param dbUrl Path to the SQLite settings database
   * @param logs Log channels used for diagnostics
   * @param openCond Condition to open the database with
   */
  SqliteSettingsStore(std::string dbUrl,
                      osc_log::LogManager& logs,
                      DBOpenCondition openCond = DBOpenCondition::OpenCreate);

  ~SqliteSettingsStore() override;

  SqliteSettingsStore(const SqliteSettingsStore&) = delete;
  SqliteSettingsStore& operator=(const SqliteSettingsStore&) = delete;
  SqliteSettingsStore(SqliteSettingsStore&&) = delete;
  SqliteSettingsStore& operator=(SqliteSettingsStore&&) = delete;

  bool isFirstAppStart() override;
  void setFirstAppStart(bool firstAppStart) override;

  bool isFileLoggingEnabled() override;
  void setFileLoggingEnabled(bool enabled) override;

private:
  // Custom deleter for sqlite3 pointer
  struct Sqlite3Deleter
  {
    void operator()(sqlite3* db) const
    {
      if (db)
      {
        sqlite3_close(db);
      }
    }
  };

  struct StatementDeleter
  {
    void operator()(sqlite3_stmt* stmt) const
    {
      sqlite3_finalize(stmt);
    }
  };

  using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

  std::optional<bool> readBool(const std::string& key);
  void writeBool(const std::string& key, bool value);

  // Open on demand; caller holds mutex_
  sqlite3* connection();
  void executeQuery(sqlite3* db, const std::string& query);
  Statement prepare(sqlite3* db, const std::string& query);

  std::string dbUrl_;
  osc_log::LogManager& logs_;
  DBOpenCondition openCond_;

  std::mutex mutex_;
  std::unique_ptr<sqlite3, Sqlite3Deleter> db_;
};

}  // namespace osc_store

#endif  // OSC_STORE_SQLITE_SETTINGS_STORE_HPP
