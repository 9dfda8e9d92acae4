// Ticket: 0001_first_start_bootstrap

#include "osc-store/src/SqliteMetricTypeStore.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>

#include "osc-transfer/src/Records.hpp"

namespace osc_store
{

SqliteMetricTypeStore::SqliteMetricTypeStore(std::string dbPath,
                                             osc_log::LogManager& logs)
  : dbPath_{std::move(dbPath)}, logs_{logs}
{
}

SqliteMetricTypeStore::~SqliteMetricTypeStore() = default;

std::size_t SqliteMetricTypeStore::insertAll(
  const std::vector<osc_data::MetricTypeDefinition>& definitions)
{
  std::scoped_lock lock{mutex_};

  auto& db = database();
  auto& dao = db.getDAO<osc_transfer::MetricTypeRecord>();

  std::size_t inserted = 0;
  db.withTransaction(
    [&]()
    {
      // Identity of a stored channel: key plus display name
      std::set<std::pair<uint32_t, std::string>> stored;
      auto const existing = dao.selectAll();
      for (const auto& record : existing)
      {
        stored.emplace(record.type_key, record.name);
      }

      for (const auto& definition : definitions)
      {
        auto record = definition.toRecord();
        if (!stored.emplace(record.type_key, record.name).second)
        {
          continue;
        }
        dao.insert(record);
        ++inserted;
      }

      // A rejected row must abort the whole batch
      auto const expected = existing.size() + inserted;
      auto const rowCount = dao.selectAll().size();
      if (rowCount != expected)
      {
        throw std::runtime_error{
          "Metric type insert incomplete: expected " +
          std::to_string(expected) + " rows, found " +
          std::to_string(rowCount)};
      }
    });

  logs_.logger()->debug("Stored {} of {} metric types in {}",
                        inserted,
                        definitions.size(),
                        dbPath_);
  return inserted;
}

std::vector<osc_data::MetricTypeDefinition> SqliteMetricTypeStore::selectAll()
{
  std::scoped_lock lock{mutex_};

  auto records = database().getDAO<osc_transfer::MetricTypeRecord>().selectAll();
  std::sort(records.begin(),
            records.end(),
            [](const osc_transfer::MetricTypeRecord& a,
               const osc_transfer::MetricTypeRecord& b) { return a.id < b.id; });

  std::vector<osc_data::MetricTypeDefinition> definitions;
  definitions.reserve(records.size());
  for (const auto& record : records)
  {
    definitions.push_back(osc_data::MetricTypeDefinition::fromRecord(record));
  }
  return definitions;
}

cpp_sqlite::Database& SqliteMetricTypeStore::database()
{
  if (!database_)
  {
    logs_.logger()->debug("Opening metrics database: {}", dbPath_);

    // Read-write mode, creates the file if it doesn't exist; throws
    // std::runtime_error if the path cannot be opened
    auto database = std::make_unique<cpp_sqlite::Database>(dbPath_, true);

    // Create the table before any transaction touches it
    database->getDAO<osc_transfer::MetricTypeRecord>();
    database_ = std::move(database);
  }
  return *database_;
}

}  // namespace osc_store
