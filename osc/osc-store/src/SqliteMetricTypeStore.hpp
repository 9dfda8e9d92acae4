// Ticket: 0001_first_start_bootstrap

#ifndef OSC_STORE_SQLITE_METRIC_TYPE_STORE_HPP
#define OSC_STORE_SQLITE_METRIC_TYPE_STORE_HPP

#include <memory>
#include <mutex>
#include <string>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "osc-log/src/LogManager.hpp"
#include "osc-store/src/MetricTypeStore.hpp"

namespace osc_store
{

/**
 * @brief MetricTypeStore backed by a cpp_sqlite MetricTypeRecord table
 *
 * insertAll() writes inside a single transaction and skips definitions whose
 * (key, display name) pair is already stored, so re-running a seed that
 * already succeeded leaves the table unchanged.
 *
 * The database is opened on first access; an open failure is reported by
 * that call and retried on the next one.
 *
 * Thread Safety:
 *   All public methods are thread-safe via internal mutex.
 */
class SqliteMetricTypeStore : public MetricTypeStore
{
public:
  /**
   * @param dbPath Path to the SQLite metrics database (created if missing)
   * @param logs Log channels used for diagnostics
   */
  SqliteMetricTypeStore(std::string dbPath, osc_log::LogManager& logs);

  ~SqliteMetricTypeStore() override;

  SqliteMetricTypeStore(const SqliteMetricTypeStore&) = delete;
  SqliteMetricTypeStore& operator=(const SqliteMetricTypeStore&) = delete;
  SqliteMetricTypeStore(SqliteMetricTypeStore&&) = delete;
  SqliteMetricTypeStore& operator=(SqliteMetricTypeStore&&) = delete;

  std::size_t insertAll(
    const std::vector<osc_data::MetricTypeDefinition>& definitions) override;

  std::vector<osc_data::MetricTypeDefinition> selectAll() override;

private:
  // Open on demand; caller holds mutex_
  cpp_sqlite::Database& database();

  std::string dbPath_;
  osc_log::LogManager& logs_;

  std::mutex mutex_;
  std::unique_ptr<cpp_sqlite::Database> database_;
};

}  // namespace osc_store

#endif  // OSC_STORE_SQLITE_METRIC_TYPE_STORE_HPP
