// Ticket: 0001_first_start_bootstrap

#include "osc-store/src/SqliteSettingsStore.hpp"

#include <stdexcept>
#include <utility>

namespace osc_store
{

SqliteSettingsStore::SqliteSettingsStore(std::string dbUrl,
                                         osc_log::LogManager& logs,
                                         DBOpenCondition openCond)
  : dbUrl_{std::move(dbUrl)}, logs_{logs}, openCond_{openCond}
{
}

SqliteSettingsStore::~SqliteSettingsStore()
{
  if (db_)
  {
    logs_.logger()->debug("Closing settings database: {}", dbUrl_);
  }
}

bool SqliteSettingsStore::isFirstAppStart()
{
  return readBool(kFirstAppStartKey).value_or(true);
}

void SqliteSettingsStore::setFirstAppStart(bool firstAppStart)
{
  writeBool(kFirstAppStartKey, firstAppStart);
}

bool SqliteSettingsStore::isFileLoggingEnabled()
{
  return readBool(kFileLoggingEnabledKey).value_or(false);
}

void SqliteSettingsStore::setFileLoggingEnabled(bool enabled)
{
  writeBool(kFileLoggingEnabledKey, enabled);
}

std::optional<bool> SqliteSettingsStore::readBool(const std::string& key)
{
  std::scoped_lock lock{mutex_};

  sqlite3* db = connection();
  auto stmt = prepare(db, "SELECT value FROM settings WHERE key = ?1;");
  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);

  int const rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW)
  {
    return sqlite3_column_int64(stmt.get(), 0) != 0;
  }
  if (rc == SQLITE_DONE)
  {
    return std::nullopt;
  }

  throw std::runtime_error("Failed to read setting '" + key +
                           "': " + sqlite3_errmsg(db));
}

void SqliteSettingsStore::writeBool(const std::string& key, bool value)
{
  std::scoped_lock lock{mutex_};

  sqlite3* db = connection();
  auto stmt = prepare(db,
                      "INSERT INTO settings (key, value) VALUES (?1, ?2) "
                      "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 2, value ? 1 : 0);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
  {
    throw std::runtime_error("Failed to write setting '" + key +
                             "': " + sqlite3_errmsg(db));
  }

  logs_.logger()->debug("Setting {} = {}", key, value);
}

sqlite3* SqliteSettingsStore::connection()
{
  if (db_)
  {
    return db_.get();
  }

  auto logger = logs_.logger();
  logger->debug("Opening settings database: {}", dbUrl_);

  sqlite3* rawDb = nullptr;
  int rc = sqlite3_open_v2(
    dbUrl_.c_str(), &rawDb, static_cast<int>(openCond_), nullptr);

  if (rc != SQLITE_OK)
  {
    const char* errMsg = rawDb ? sqlite3_errmsg(rawDb) : nullptr;
    std::string errorStr = errMsg ? errMsg : "Unknown error";

    // Close the database if it was partially opened
    if (rawDb)
    {
      sqlite3_close(rawDb);
    }

    throw std::runtime_error("Failed to open settings database " + dbUrl_ +
                             ": " + errorStr);
  }

  // Only take ownership once the schema exists, so a failure here is
  // retried from scratch on the next access
  std::unique_ptr<sqlite3, Sqlite3Deleter> db{rawDb};
  executeQuery(db.get(), "PRAGMA journal_mode = WAL;");
  executeQuery(db.get(),
               "CREATE TABLE IF NOT EXISTS settings ("
               "key TEXT PRIMARY KEY NOT NULL, "
               "value INTEGER NOT NULL);");

  db_ = std::move(db);
  logger->info("Settings database opened: {}", dbUrl_);
  return db_.get();
}

void SqliteSettingsStore::executeQuery(sqlite3* db, const std::string& query)
{
  char* errMsg = nullptr;
  int rc = sqlite3_exec(db, query.c_str(), nullptr, nullptr, &errMsg);

  if (rc != SQLITE_OK)
  {
    std::string errorStr = errMsg ? errMsg : "Unknown SQL error";
    sqlite3_free(errMsg);
    throw std::runtime_error("SQL error in settings database: " + errorStr);
  }
}

SqliteSettingsStore::Statement SqliteSettingsStore::prepare(
  sqlite3* db,
  const std::string& query)
{
  sqlite3_stmt* rawStmt = nullptr;
  if (sqlite3_prepare_v2(db, query.c_str(), -1, &rawStmt, nullptr) !=
      SQLITE_OK)
  {
    throw std::runtime_error(std::string{"Failed to prepare statement: "} +
                             sqlite3_errmsg(db));
  }
  return Statement{rawStmt};
}

}  // namespace osc_store
