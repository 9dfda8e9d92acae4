// Ticket: 0001_first_start_bootstrap

#include "osc-boot/src/BootstrapCoordinator.hpp"

#include <exception>
#include <utility>

#include "osc-data/src/DefaultMetricTypes.hpp"

namespace osc_boot
{

BootstrapCoordinator::BootstrapCoordinator(
  osc_store::SettingsStore& settings,
  osc_store::MetricTypeStore& metricTypes,
  osc_log::LogManager& logs,
  osc_log::LogManager::Config logConfig,
  DatasetProvider datasetProvider)
  : settings_{settings},
    metricTypes_{metricTypes},
    logs_{logs},
    logConfig_{std::move(logConfig)},
    datasetProvider_{std::move(datasetProvider)}
{
}

BootstrapCoordinator::BootstrapCoordinator(
  osc_store::SettingsStore& settings,
  osc_store::MetricTypeStore& metricTypes,
  osc_log::LogManager& logs,
  osc_log::LogManager::Config logConfig)
  : BootstrapCoordinator{settings,
                         metricTypes,
                         logs,
                         std::move(logConfig),
                         &osc_data::buildDefaultMetricTypes}
{
}

BootstrapCoordinator::~BootstrapCoordinator()
{
  wait();
}

bool BootstrapCoordinator::start()
{
  // Held across the launch so a concurrent wait() sees both threads
  std::scoped_lock lock{joinMutex_};
  if (started_)
  {
    logs_.logger()->debug("Bootstrap already started, ignoring start()");
    return false;
  }
  started_ = true;

  loggingThread_ = std::jthread{[this]() { runLoggingInitialization(); }};
  seedingThread_ = std::jthread{[this]() { runDefaultDataSeeding(); }};
  return true;
}

void BootstrapCoordinator::wait()
{
  std::scoped_lock lock{joinMutex_};
  if (loggingThread_.joinable())
  {
    loggingThread_.join();
  }
  if (seedingThread_.joinable())
  {
    seedingThread_.join();
  }
}

BootstrapCoordinator::LoggingOutcome
BootstrapCoordinator::runLoggingInitialization()
{
  auto outcome = LoggingOutcome::Initialized;

  auto config = logConfig_;
  try
  {
    config.fileLoggingEnabled = settings_.isFileLoggingEnabled();
  }
  catch (const std::exception& e)
  {
    // The managed channel does not exist yet
    logs_.fallback()->error(
      "Failed to retrieve isFileLoggingEnabled setting: {}", e.what());
    config.fileLoggingEnabled = false;
    outcome = LoggingOutcome::InitializedWithDefault;
  }

  try
  {
    logs_.init(config);
    logs_.logger()->info("LogManager initialized. File logging enabled: {}",
                         logs_.fileLoggingEnabled());
  }
  catch (const std::exception& e)
  {
    logs_.fallback()->error("Failed to initialize LogManager: {}", e.what());
    outcome = LoggingOutcome::Failed;
  }

  loggingOutcome_ = outcome;
  return outcome;
}

BootstrapCoordinator::SeedOutcome BootstrapCoordinator::runDefaultDataSeeding()
{
  auto const finish = [this](SeedOutcome outcome)
  {
    seedOutcome_ = outcome;
    return outcome;
  };

  bool firstStart = false;
  try
  {
    firstStart = settings_.isFirstAppStart();
  }
  catch (const std::exception& e)
  {
    logs_.logger()->error("Failed to read isFirstAppStart, default data not "
                          "checked this start: {}",
                          e.what());
    return finish(SeedOutcome::SettingsReadFailed);
  }

  logs_.logger()->debug("Checking for first app start. isFirstAppStart: {}",
                        firstStart);
  if (!firstStart)
  {
    logs_.logger()->debug(
      "Not the first app start. Default data should already exist.");
    return finish(SeedOutcome::AlreadySeeded);
  }

  logs_.logger()->info(
    "First app start detected. Inserting default metric types...");
  try
  {
    auto const definitions = datasetProvider_();
    auto const inserted = metricTypes_.insertAll(definitions);
    logs_.logger()->debug(
      "Inserted {} of {} default metric types", inserted, definitions.size());
  }
  catch (const std::exception& e)
  {
    // Flag stays set: the seed is retried on the next start
    logs_.logger()->error("Error inserting default metric types: {}", e.what());
    return finish(SeedOutcome::SeedWriteFailed);
  }

  try
  {
    settings_.setFirstAppStart(false);
  }
  catch (const std::exception& e)
  {
    logs_.logger()->error(
      "Default metric types inserted but first start could not be marked "
      "completed, seeding will repeat on next start: {}",
      e.what());
    return finish(SeedOutcome::FlagWriteFailed);
  }

  logs_.logger()->info("Default metric types inserted and first start marked "
                       "as completed.");
  return finish(SeedOutcome::Seeded);
}

BootstrapCoordinator::LoggingOutcome BootstrapCoordinator::loggingOutcome()
  const
{
  return loggingOutcome_;
}

BootstrapCoordinator::SeedOutcome BootstrapCoordinator::seedOutcome() const
{
  return seedOutcome_;
}

std::string_view toString(BootstrapCoordinator::LoggingOutcome outcome)
{
  using Outcome = BootstrapCoordinator::LoggingOutcome;
  switch (outcome)
  {
    case Outcome::Pending:
      return "pending";
    case Outcome::Initialized:
      return "initialized";
    case Outcome::InitializedWithDefault:
      return "initialized with default settings";
    case Outcome::Failed:
      return "failed";
  }
  return "unknown";
}

std::string_view toString(BootstrapCoordinator::SeedOutcome outcome)
{
  using Outcome = BootstrapCoordinator::SeedOutcome;
  switch (outcome)
  {
    case Outcome::Pending:
      return "pending";
    case Outcome::AlreadySeeded:
      return "already seeded";
    case Outcome::Seeded:
      return "seeded";
    case Outcome::SettingsReadFailed:
      return "settings read failed";
    case Outcome::SeedWriteFailed:
      return "seed write failed";
    case Outcome::FlagWriteFailed:
      return "flag write failed";
  }
  return "unknown";
}

}  // namespace osc_boot
